#pragma once

#include <jni.h>
#include <string>

// String conversion between Java and native; failures throw JNIException
class JniUtils {
public:
    // Null jstring yields an empty string
    static std::string jstring_to_string(JNIEnv* env, jstring jstr);
    static jstring string_to_jstring(JNIEnv* env, const std::string& str);
};
