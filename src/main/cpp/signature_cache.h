#ifndef SIGNATURE_CACHE_H
#define SIGNATURE_CACHE_H

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

/**
 * Memo of object-type signature fragments keyed by fully-qualified class
 * name ("java.lang.String" -> "Ljava/lang/String;"). Entries are never
 * evicted except by clear(). Safe for concurrent use.
 */
class SignatureCache {
public:
	SignatureCache() = default;

	SignatureCache(const SignatureCache&) = delete;
	SignatureCache& operator=(const SignatureCache&) = delete;

	// Cached fragment for className, computing and storing it on a miss
	std::string getOrCompute(const std::string& className);

	void clear();
	size_t size() const;

	// Process-wide instance used by the JNI entry points
	static SignatureCache& shared();

	// "a.b.C" -> "La/b/C;" without touching any cache
	static std::string objectSignature(const std::string& className);

private:
	mutable std::mutex mutex_;
	std::unordered_map<std::string, std::string> entries_;
};

#endif // SIGNATURE_CACHE_H
