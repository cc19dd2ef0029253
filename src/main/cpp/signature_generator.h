#ifndef SIGNATURE_GENERATOR_H
#define SIGNATURE_GENERATOR_H

#include <string>
#include <vector>
#include "signature_cache.h"
#include "type_descriptor.h"

/**
 * Builds JNI type signatures, e.g. "main([Ljava/lang/String;I)V", for
 * GetMethodID / GetStaticMethodID / GetFieldID lookups.
 *
 * All arguments are validated before any text is produced; a failed call
 * throws InvalidArgumentException and leaves the cache untouched.
 */
class SignatureGenerator {
public:
	typedef std::vector<const TypeDescriptor*> TypeList;

	// Uses SignatureCache::shared()
	SignatureGenerator();
	// cache may be null, in which case object fragments are computed every time
	explicit SignatureGenerator(SignatureCache* cache);

	// "(" + parameter signatures + ")" + return signature
	std::string buildSignature(const TypeDescriptor* returnType, const TypeList& paramTypes) const;

	// name + buildSignature(returnType, paramTypes); name must be non-null and non-empty
	std::string buildSignatureWithName(const char* name, const TypeDescriptor* returnType,
		const TypeList& paramTypes) const;
	std::string buildSignatureWithName(const std::string& name, const TypeDescriptor* returnType,
		const TypeList& paramTypes) const;

	// Constructor lookups always return void: "(...)V"
	std::string buildConstructorSignature(const TypeList& paramTypes) const;

	// Same output as buildSignatureWithName; kept separate for call-site readability
	std::string buildStaticMethodSignature(const char* name, const TypeDescriptor* returnType,
		const TypeList& paramTypes) const;
	std::string buildStaticMethodSignature(const std::string& name, const TypeDescriptor* returnType,
		const TypeList& paramTypes) const;

	// Signature of a single type, as used for field lookups
	std::string typeSignature(const TypeDescriptor* type) const;

	void clearCache();

	SignatureCache* cache() const { return cache_; }

private:
	static void validate(const TypeDescriptor* returnType, const TypeList& paramTypes);
	void appendTypeSignature(std::string& out, const TypeDescriptor& type) const;

	SignatureCache* cache_;
};

#endif // SIGNATURE_GENERATOR_H
