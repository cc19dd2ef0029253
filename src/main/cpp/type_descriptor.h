#ifndef TYPE_DESCRIPTOR_H
#define TYPE_DESCRIPTOR_H

#include <memory>
#include <string>

// The nine JNI primitive kinds
enum class PrimitiveKind {
	Void,
	Boolean,
	Byte,
	Char,
	Short,
	Int,
	Long,
	Float,
	Double
};

/**
 * What the signature generator needs to know about a Java type.
 * Implemented over a plain value (SimpleType) and over a live
 * java.lang.Class reached through JNI (ReflectedType).
 */
class TypeDescriptor {
public:
	virtual ~TypeDescriptor() = default;

	virtual bool isPrimitive() const = 0;
	// Only meaningful when isPrimitive() is true
	virtual PrimitiveKind primitiveKind() const = 0;

	virtual bool isArray() const = 0;
	// Element type of an array; null for non-arrays
	virtual std::shared_ptr<const TypeDescriptor> componentType() const = 0;

	// Fully-qualified dotted name, e.g. "java.lang.String"
	virtual std::string qualifiedName() const = 0;
};

// Descriptor letter for a primitive kind ('I' for int, 'J' for long, ...)
char primitiveCode(PrimitiveKind kind);

// Java keyword for a primitive kind ("int", "long", ...)
const char* primitiveName(PrimitiveKind kind);

// Exact keyword match; boxed names such as "java.lang.Integer" never match
bool primitiveFromName(const std::string& name, PrimitiveKind* kind);

bool primitiveFromCode(char code, PrimitiveKind* kind);

#endif // TYPE_DESCRIPTOR_H
