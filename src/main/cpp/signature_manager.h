#ifndef SIGNATURE_MANAGER_H
#define SIGNATURE_MANAGER_H

#include <jni.h>

/**
 * JNI bodies for the static natives of com.jnisig.JniSignatureGenerator.
 * Each returns null with a pending Java exception on failure.
 */
class SignatureManager {
public:
	static jstring generateSignature(JNIEnv* env, jclass cls, jclass returnType, jobjectArray paramTypes);
	static jstring generateSignatureWithMethodName(JNIEnv* env, jclass cls, jstring name,
		jclass returnType, jobjectArray paramTypes);
	static jstring generateConstructorSignature(JNIEnv* env, jclass cls, jobjectArray paramTypes);
	static jstring generateStaticMethodSignature(JNIEnv* env, jclass cls, jstring name,
		jclass returnType, jobjectArray paramTypes);

	// Field descriptor of a single class, e.g. "[I" for int[].class
	static jstring generateTypeSignature(JNIEnv* env, jclass cls, jclass type);

	// Signature for a JSON method spec (see MethodSpec)
	static jstring generateSignatureFromJson(JNIEnv* env, jclass cls, jstring spec);

	// Apply a JSON GeneratorConfig
	static void configure(JNIEnv* env, jclass cls, jstring config);

	static void clearCache(JNIEnv* env, jclass cls);
};

#endif // SIGNATURE_MANAGER_H
