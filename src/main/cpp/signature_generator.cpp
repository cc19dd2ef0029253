#include "signature_generator.h"
#include "jni_error_handler.h"
#include "simple_type.h"
#include <memory>
#include <utility>

SignatureGenerator::SignatureGenerator() : cache_(&SignatureCache::shared()) {}

SignatureGenerator::SignatureGenerator(SignatureCache* cache) : cache_(cache) {}

std::string SignatureGenerator::buildSignature(const TypeDescriptor* returnType, const TypeList& paramTypes) const {
	validate(returnType, paramTypes);

	std::string signature;
	signature += '(';
	for (const TypeDescriptor* param : paramTypes) {
		appendTypeSignature(signature, *param);
	}
	signature += ')';
	appendTypeSignature(signature, *returnType);
	return signature;
}

std::string SignatureGenerator::buildSignatureWithName(const char* name, const TypeDescriptor* returnType,
	const TypeList& paramTypes) const {
	if (name == nullptr) {
		throw InvalidArgumentException::empty_method_name();
	}
	return buildSignatureWithName(std::string(name), returnType, paramTypes);
}

std::string SignatureGenerator::buildSignatureWithName(const std::string& name, const TypeDescriptor* returnType,
	const TypeList& paramTypes) const {
	if (name.empty()) {
		throw InvalidArgumentException::empty_method_name();
	}
	return name + buildSignature(returnType, paramTypes);
}

std::string SignatureGenerator::buildConstructorSignature(const TypeList& paramTypes) const {
	static const SimpleType::Ptr voidType = SimpleType::Primitive(PrimitiveKind::Void);
	return buildSignature(voidType.get(), paramTypes);
}

std::string SignatureGenerator::buildStaticMethodSignature(const char* name, const TypeDescriptor* returnType,
	const TypeList& paramTypes) const {
	return buildSignatureWithName(name, returnType, paramTypes);
}

std::string SignatureGenerator::buildStaticMethodSignature(const std::string& name,
	const TypeDescriptor* returnType, const TypeList& paramTypes) const {
	return buildSignatureWithName(name, returnType, paramTypes);
}

std::string SignatureGenerator::typeSignature(const TypeDescriptor* type) const {
	if (!type) {
		throw InvalidArgumentException(InvalidArgumentException::TYPE_NAME, "Type cannot be null");
	}
	std::string signature;
	appendTypeSignature(signature, *type);
	return signature;
}

void SignatureGenerator::clearCache() {
	if (cache_) {
		cache_->clear();
	}
}

void SignatureGenerator::validate(const TypeDescriptor* returnType, const TypeList& paramTypes) {
	if (!returnType) {
		throw InvalidArgumentException::null_return_type();
	}
	for (size_t i = 0; i < paramTypes.size(); ++i) {
		if (!paramTypes[i]) {
			throw InvalidArgumentException::null_parameter(static_cast<int>(i));
		}
	}
}

void SignatureGenerator::appendTypeSignature(std::string& out, const TypeDescriptor& type) const {
	// Walk down nested arrays, one '[' per level
	const TypeDescriptor* current = &type;
	std::shared_ptr<const TypeDescriptor> holder;
	while (current->isArray()) {
		std::shared_ptr<const TypeDescriptor> component = current->componentType();
		if (!component) {
			throw InvalidArgumentException(InvalidArgumentException::TYPE_NAME,
				"Array type " + current->qualifiedName() + " has no component type");
		}
		out += '[';
		holder = std::move(component);
		current = holder.get();
	}

	if (current->isPrimitive()) {
		out += primitiveCode(current->primitiveKind());
		return;
	}

	std::string className = current->qualifiedName();
	out += cache_ ? cache_->getOrCompute(className) : SignatureCache::objectSignature(className);
}
