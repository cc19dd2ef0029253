#ifndef REFLECTED_TYPE_H
#define REFLECTED_TYPE_H

#include <jni.h>
#include <memory>
#include <string>
#include "type_descriptor.h"

/**
 * TypeDescriptor over a live java.lang.Class, queried through
 * Class.isPrimitive / isArray / getComponentType / getName.
 *
 * Only valid on the thread that owns env, and only while the wrapped
 * reference is alive. Failed reflection calls throw TypeResolutionException.
 */
class ReflectedType : public TypeDescriptor {
public:
	// Borrows cls; the caller keeps ownership of the reference
	ReflectedType(JNIEnv* env, jclass cls);
	~ReflectedType() override;

	ReflectedType(const ReflectedType&) = delete;
	ReflectedType& operator=(const ReflectedType&) = delete;

	bool isPrimitive() const override { return primitive_; }
	PrimitiveKind primitiveKind() const override { return kind_; }
	bool isArray() const override { return array_; }
	std::shared_ptr<const TypeDescriptor> componentType() const override;
	std::string qualifiedName() const override;

	jclass get() const { return cls_; }

private:
	// Takes ownership of a local reference returned by getComponentType()
	ReflectedType(JNIEnv* env, jclass cls, bool owns_ref);

	void resolve();

	JNIEnv* env_;
	jclass cls_;
	bool owns_ref_;
	bool primitive_;
	bool array_;
	PrimitiveKind kind_;
};

#endif // REFLECTED_TYPE_H
