#ifndef SIMPLE_TYPE_H
#define SIMPLE_TYPE_H

#include <memory>
#include <string>
#include "type_descriptor.h"

/**
 * Plain-value type descriptor, for callers that have a type name but no
 * live java.lang.Class (native code building lookup signatures, JSON specs).
 */
class SimpleType : public TypeDescriptor {
public:
	typedef std::shared_ptr<const SimpleType> Ptr;

	static Ptr Primitive(PrimitiveKind kind);
	static Ptr ArrayOf(std::shared_ptr<const TypeDescriptor> component);
	// Throws InvalidArgumentException on an empty name
	static Ptr Object(const std::string& qualifiedName);

	// Parses "int", "java.lang.String", "java.lang.String[][]" and the
	// Class.getName() array forms "[I" and "[Ljava.lang.String;".
	// Throws InvalidArgumentException on malformed input.
	static Ptr Parse(const std::string& javaName);

	bool isPrimitive() const override { return category_ == PRIMITIVE; }
	PrimitiveKind primitiveKind() const override { return kind_; }
	bool isArray() const override { return category_ == ARRAY; }
	std::shared_ptr<const TypeDescriptor> componentType() const override { return component_; }
	std::string qualifiedName() const override;

private:
	enum Category {
		PRIMITIVE,
		ARRAY,
		OBJECT
	};

	SimpleType(Category category, PrimitiveKind kind,
		std::shared_ptr<const TypeDescriptor> component, const std::string& name);

	static Ptr parseBinaryArray(const std::string& javaName);
	static Ptr parseSourceName(const std::string& javaName);

	Category category_;
	PrimitiveKind kind_;
	std::shared_ptr<const TypeDescriptor> component_;
	std::string name_;
};

#endif // SIMPLE_TYPE_H
