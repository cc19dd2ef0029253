#include "simple_type.h"
#include "jni_error_handler.h"
#include <algorithm>
#include <utility>

namespace {

InvalidArgumentException badTypeName(const std::string& javaName, const char* reason) {
	return InvalidArgumentException(InvalidArgumentException::TYPE_NAME,
		"Invalid type name '" + javaName + "': " + reason);
}

// Dotted names must not have empty segments ("a..b", ".a", "a.")
bool validQualifiedName(const std::string& name) {
	if (name.empty() || name.front() == '.' || name.back() == '.') return false;
	if (name.find("..") != std::string::npos) return false;
	return name.find_first_of("[]; ") == std::string::npos;
}

} // namespace

SimpleType::SimpleType(Category category, PrimitiveKind kind,
	std::shared_ptr<const TypeDescriptor> component, const std::string& name)
	: category_(category), kind_(kind), component_(std::move(component)), name_(name) {}

SimpleType::Ptr SimpleType::Primitive(PrimitiveKind kind) {
	return Ptr(new SimpleType(PRIMITIVE, kind, nullptr, primitiveName(kind)));
}

SimpleType::Ptr SimpleType::ArrayOf(std::shared_ptr<const TypeDescriptor> component) {
	if (!component) {
		throw InvalidArgumentException(InvalidArgumentException::TYPE_NAME,
			"Array component type cannot be null");
	}
	if (component->isPrimitive() && component->primitiveKind() == PrimitiveKind::Void) {
		throw InvalidArgumentException(InvalidArgumentException::TYPE_NAME,
			"Array component type cannot be void");
	}
	return Ptr(new SimpleType(ARRAY, PrimitiveKind::Void, std::move(component), ""));
}

SimpleType::Ptr SimpleType::Object(const std::string& qualifiedName) {
	if (qualifiedName.empty()) {
		throw InvalidArgumentException(InvalidArgumentException::TYPE_NAME,
			"Class name cannot be empty");
	}
	return Ptr(new SimpleType(OBJECT, PrimitiveKind::Void, nullptr, qualifiedName));
}

std::string SimpleType::qualifiedName() const {
	if (category_ == ARRAY) {
		return component_->qualifiedName() + "[]";
	}
	return name_;
}

SimpleType::Ptr SimpleType::Parse(const std::string& javaName) {
	if (javaName.empty()) {
		throw InvalidArgumentException(InvalidArgumentException::TYPE_NAME,
			"Type name cannot be empty");
	}
	if (javaName[0] == '[') {
		return parseBinaryArray(javaName);
	}
	return parseSourceName(javaName);
}

SimpleType::Ptr SimpleType::parseBinaryArray(const std::string& javaName) {
	size_t dims = javaName.find_first_not_of('[');
	if (dims == std::string::npos) {
		throw badTypeName(javaName, "missing element type");
	}

	std::string element = javaName.substr(dims);
	Ptr base;
	PrimitiveKind kind;
	if (element.size() == 1 && primitiveFromCode(element[0], &kind)) {
		base = Primitive(kind);
	} else if (element.size() > 2 && element.front() == 'L' && element.back() == ';') {
		std::string name = element.substr(1, element.size() - 2);
		// Accept internal slashes as well as the dotted Class.getName() form
		std::replace(name.begin(), name.end(), '/', '.');
		if (!validQualifiedName(name)) {
			throw badTypeName(javaName, "malformed class name");
		}
		base = Object(name);
	} else {
		throw badTypeName(javaName, "unknown element descriptor");
	}

	if (base->isPrimitive() && base->primitiveKind() == PrimitiveKind::Void) {
		throw badTypeName(javaName, "void cannot be an array element");
	}

	Ptr result = base;
	for (size_t i = 0; i < dims; ++i) {
		result = ArrayOf(result);
	}
	return result;
}

SimpleType::Ptr SimpleType::parseSourceName(const std::string& javaName) {
	std::string base = javaName;
	size_t dims = 0;
	while (base.size() >= 2 && base.compare(base.size() - 2, 2, "[]") == 0) {
		base.erase(base.size() - 2);
		++dims;
	}

	Ptr result;
	PrimitiveKind kind;
	if (primitiveFromName(base, &kind)) {
		if (kind == PrimitiveKind::Void && dims > 0) {
			throw badTypeName(javaName, "void cannot be an array element");
		}
		result = Primitive(kind);
	} else if (validQualifiedName(base)) {
		result = Object(base);
	} else {
		throw badTypeName(javaName, "malformed class name");
	}

	for (size_t i = 0; i < dims; ++i) {
		result = ArrayOf(result);
	}
	return result;
}
