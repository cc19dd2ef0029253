#include "jni_error_handler.h"

InvalidArgumentException InvalidArgumentException::null_return_type() {
    return InvalidArgumentException(RETURN_TYPE, "Return type cannot be null");
}

InvalidArgumentException InvalidArgumentException::null_parameter(int index) {
    return InvalidArgumentException(PARAMETER_TYPE,
        "Parameter type at index " + std::to_string(index) + " cannot be null", index);
}

InvalidArgumentException InvalidArgumentException::empty_method_name() {
    return InvalidArgumentException(METHOD_NAME, "Method name cannot be null or empty");
}

bool JNIErrorHandler::check_exception(JNIEnv* env) {
    if (!env) return false;
    return env->ExceptionCheck() == JNI_TRUE;
}

void JNIErrorHandler::clear_exception(JNIEnv* env) {
    if (!check_exception(env)) return;

    jthrowable exception = env->ExceptionOccurred();
    env->ExceptionClear();
    if (!exception) return;

    // Throwable.toString() gives "class: message" in one call
    jclass throwable_class = env->FindClass("java/lang/Throwable");
    if (throwable_class) {
        jmethodID to_string = env->GetMethodID(throwable_class, "toString", "()Ljava/lang/String;");
        if (to_string) {
            jstring description = (jstring)env->CallObjectMethod(exception, to_string);
            // Runs while converting native exceptions, so it must not throw
            if (description && !env->ExceptionCheck()) {
                const char* text = env->GetStringUTFChars(description, nullptr);
                if (text) {
                    JNISIG_LOG_ERROR("Cleared Java exception: %s", text);
                    env->ReleaseStringUTFChars(description, text);
                }
            }
            if (description) env->DeleteLocalRef(description);
        }
        env->DeleteLocalRef(throwable_class);
    }
    env->ExceptionClear();
    env->DeleteLocalRef(exception);
}

void JNIErrorHandler::throw_java_exception(JNIEnv* env, const char* class_name, const std::string& message) {
    if (!env) return;

    clear_exception(env);

    jclass exception_class = env->FindClass(class_name);
    if (exception_class) {
        // Log first: nothing may run between ThrowNew and the return to Java
        JNISIG_LOG_WARN("Throwing %s: %s", class_name, message.c_str());
        env->ThrowNew(exception_class, message.c_str());
        env->DeleteLocalRef(exception_class);
        return;
    }

    env->ExceptionClear();
    jclass runtime_class = env->FindClass("java/lang/RuntimeException");
    if (runtime_class) {
        std::string fallback_msg = "Failed to find exception class " + std::string(class_name) + ": " + message;
        JNISIG_LOG_ERROR("Throwing RuntimeException (fallback): %s", fallback_msg.c_str());
        env->ThrowNew(runtime_class, fallback_msg.c_str());
        env->DeleteLocalRef(runtime_class);
    }
}

void JNIErrorHandler::throw_runtime_exception(JNIEnv* env, const std::string& message) {
    throw_java_exception(env, "java/lang/RuntimeException", message);
}

void JNIErrorHandler::throw_illegal_argument(JNIEnv* env, const std::string& message) {
    throw_java_exception(env, "java/lang/IllegalArgumentException", message);
}

void JNIErrorHandler::throw_out_of_memory(JNIEnv* env, const std::string& message) {
    throw_java_exception(env, "java/lang/OutOfMemoryError", message);
}

void JNIErrorHandler::handle_native_exception(JNIEnv* env, const std::exception& e) {
    if (dynamic_cast<const std::invalid_argument*>(&e)) {
        // Argument errors keep their message verbatim so Java callers see what they passed wrong
        throw_illegal_argument(env, e.what());
    } else if (dynamic_cast<const std::bad_alloc*>(&e)) {
        throw_out_of_memory(env, "Native memory allocation failed");
    } else if (dynamic_cast<const JNIException*>(&e)) {
        throw_runtime_exception(env, e.what());
    } else {
        throw_runtime_exception(env, std::string("Native exception: ") + e.what());
    }
}

void JNIErrorHandler::handle_unknown_exception(JNIEnv* env) {
    throw_runtime_exception(env, "Unknown native exception occurred");
}
