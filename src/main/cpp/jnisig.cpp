#include <jni.h>

#include "jni_logger.h"
#include "signature_manager.h"

// JNI entry points for com.jnisig.JniSignatureGenerator

extern "C" {

JNIEXPORT jint JNICALL JNI_OnLoad(JavaVM* vm, void* reserved) {
    JNIEnv* env = nullptr;
    if (vm->GetEnv((void**)&env, JNI_VERSION_1_6) != JNI_OK) {
        return JNI_ERR;
    }
    if (!JNILogger::initialize(env)) {
        JNISIG_LOG_WARN("JVM logging unavailable, using stderr");
    }
    return JNI_VERSION_1_6;
}

JNIEXPORT void JNICALL JNI_OnUnload(JavaVM* vm, void* reserved) {
    JNIEnv* env = nullptr;
    if (vm->GetEnv((void**)&env, JNI_VERSION_1_6) == JNI_OK) {
        JNILogger::shutdown(env);
    }
}

JNIEXPORT jstring JNICALL Java_com_jnisig_JniSignatureGenerator_generateSignature
  (JNIEnv* env, jclass cls, jclass returnType, jobjectArray paramTypes) {
    return SignatureManager::generateSignature(env, cls, returnType, paramTypes);
}

JNIEXPORT jstring JNICALL Java_com_jnisig_JniSignatureGenerator_generateSignatureWithMethodName
  (JNIEnv* env, jclass cls, jstring methodName, jclass returnType, jobjectArray paramTypes) {
    return SignatureManager::generateSignatureWithMethodName(env, cls, methodName, returnType, paramTypes);
}

JNIEXPORT jstring JNICALL Java_com_jnisig_JniSignatureGenerator_generateConstructorSignature
  (JNIEnv* env, jclass cls, jobjectArray paramTypes) {
    return SignatureManager::generateConstructorSignature(env, cls, paramTypes);
}

JNIEXPORT jstring JNICALL Java_com_jnisig_JniSignatureGenerator_generateStaticMethodSignature
  (JNIEnv* env, jclass cls, jstring methodName, jclass returnType, jobjectArray paramTypes) {
    return SignatureManager::generateStaticMethodSignature(env, cls, methodName, returnType, paramTypes);
}

JNIEXPORT jstring JNICALL Java_com_jnisig_JniSignatureGenerator_generateTypeSignature
  (JNIEnv* env, jclass cls, jclass type) {
    return SignatureManager::generateTypeSignature(env, cls, type);
}

JNIEXPORT jstring JNICALL Java_com_jnisig_JniSignatureGenerator_generateSignatureFromJson
  (JNIEnv* env, jclass cls, jstring spec) {
    return SignatureManager::generateSignatureFromJson(env, cls, spec);
}

JNIEXPORT void JNICALL Java_com_jnisig_JniSignatureGenerator_configure
  (JNIEnv* env, jclass cls, jstring config) {
    SignatureManager::configure(env, cls, config);
}

JNIEXPORT void JNICALL Java_com_jnisig_JniSignatureGenerator_clearCache
  (JNIEnv* env, jclass cls) {
    SignatureManager::clearCache(env, cls);
}

} // extern "C"
