#include "jni_utils.h"
#include "jni_error_handler.h"

std::string JniUtils::jstring_to_string(JNIEnv* env, jstring jstr) {
    if (!jstr) return "";
    const char* chars = env->GetStringUTFChars(jstr, nullptr);
    if (!chars) {
        throw JNIException("GetStringUTFChars failed");
    }
    std::string result(chars);
    env->ReleaseStringUTFChars(jstr, chars);
    return result;
}

jstring JniUtils::string_to_jstring(JNIEnv* env, const std::string& str) {
    jstring result = env->NewStringUTF(str.c_str());
    if (!result) {
        throw JNIException("NewStringUTF failed");
    }
    return result;
}
