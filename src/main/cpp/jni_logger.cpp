#include "jni_logger.h"
#include <cstdio>

std::mutex JNILogger::logger_mutex_;
JavaVM* JNILogger::jvm_ = nullptr;
bool JNILogger::initialized_ = false;
JNILogger::Level JNILogger::min_level_ = JNILogger::INFO;

jclass JNILogger::system_class_ = nullptr;
jfieldID JNILogger::out_field_ = nullptr;
jfieldID JNILogger::err_field_ = nullptr;
jmethodID JNILogger::println_method_ = nullptr;

bool JNILogger::initialize(JNIEnv* env) {
    std::lock_guard<std::mutex> lock(logger_mutex_);

    if (initialized_) return true;

    if (env->GetJavaVM(&jvm_) != JNI_OK) {
        jvm_ = nullptr;
        return false;
    }

    jclass local_system_class = env->FindClass("java/lang/System");
    if (!local_system_class) {
        env->ExceptionClear();
        return false;
    }
    system_class_ = (jclass)env->NewGlobalRef(local_system_class);
    env->DeleteLocalRef(local_system_class);

    out_field_ = env->GetStaticFieldID(system_class_, "out", "Ljava/io/PrintStream;");
    err_field_ = env->GetStaticFieldID(system_class_, "err", "Ljava/io/PrintStream;");

    jclass printstream_class = env->FindClass("java/io/PrintStream");
    if (printstream_class) {
        println_method_ = env->GetMethodID(printstream_class, "println", "(Ljava/lang/String;)V");
        env->DeleteLocalRef(printstream_class);
    }

    if (!out_field_ || !err_field_ || !println_method_) {
        // Stay on the stderr path rather than half-initialised
        env->ExceptionClear();
        env->DeleteGlobalRef(system_class_);
        system_class_ = nullptr;
        out_field_ = nullptr;
        err_field_ = nullptr;
        println_method_ = nullptr;
        return false;
    }

    initialized_ = true;
    return true;
}

void JNILogger::shutdown(JNIEnv* env) {
    std::lock_guard<std::mutex> lock(logger_mutex_);

    if (!initialized_) return;

    if (system_class_) {
        env->DeleteGlobalRef(system_class_);
        system_class_ = nullptr;
    }

    out_field_ = nullptr;
    err_field_ = nullptr;
    println_method_ = nullptr;
    jvm_ = nullptr;
    initialized_ = false;
}

void JNILogger::set_level(Level level) {
    std::lock_guard<std::mutex> lock(logger_mutex_);
    min_level_ = level;
}

JNILogger::Level JNILogger::level() {
    std::lock_guard<std::mutex> lock(logger_mutex_);
    return min_level_;
}

bool JNILogger::parse_level(const std::string& name, Level* out) {
    static const Level levels[] = {DEBUG, INFO, WARN, ERROR};
    for (Level candidate : levels) {
        if (name == level_string(candidate)) {
            *out = candidate;
            return true;
        }
    }
    return false;
}

void JNILogger::debug(const char* format, ...) {
    va_list args;
    va_start(args, format);
    vlog(DEBUG, format, args);
    va_end(args);
}

void JNILogger::info(const char* format, ...) {
    va_list args;
    va_start(args, format);
    vlog(INFO, format, args);
    va_end(args);
}

void JNILogger::warn(const char* format, ...) {
    va_list args;
    va_start(args, format);
    vlog(WARN, format, args);
    va_end(args);
}

void JNILogger::error(const char* format, ...) {
    va_list args;
    va_start(args, format);
    vlog(ERROR, format, args);
    va_end(args);
}

void JNILogger::vlog(Level level, const char* format, va_list args) {
    char buffer[1024];
    vsnprintf(buffer, sizeof(buffer), format, args);

    std::lock_guard<std::mutex> lock(logger_mutex_);
    if (level < min_level_) return;

    std::string line = std::string("[jnisig ") + level_string(level) + "] " + buffer;
    if (initialized_) {
        write_jvm(level, line);
    } else {
        write_stderr(line);
    }
}

void JNILogger::write_jvm(Level level, const std::string& line) {
    JNIEnvGuard env_guard;
    JNIEnv* env = env_guard.get();
    if (!env) {
        write_stderr(line);
        return;
    }

    // A caller's pending exception is set aside for println and rethrown after
    jthrowable pending = env->ExceptionOccurred();
    if (pending) {
        env->ExceptionClear();
    }

    jstring java_message = env->NewStringUTF(line.c_str());
    if (java_message) {
        // WARN and ERROR go to System.err
        jobject output_stream = env->GetStaticObjectField(system_class_, level >= WARN ? err_field_ : out_field_);
        if (output_stream) {
            env->CallVoidMethod(output_stream, println_method_, java_message);
            env->DeleteLocalRef(output_stream);
        }
        env->DeleteLocalRef(java_message);
    }
    if (env->ExceptionCheck() || !java_message) {
        env->ExceptionClear();
        write_stderr(line);
    }

    if (pending) {
        env->Throw(pending);
        env->DeleteLocalRef(pending);
    }
}

void JNILogger::write_stderr(const std::string& line) {
    std::fprintf(stderr, "%s\n", line.c_str());
}

const char* JNILogger::level_string(Level level) {
    switch (level) {
        case DEBUG: return "DEBUG";
        case INFO:  return "INFO";
        case WARN:  return "WARN";
        case ERROR: return "ERROR";
        default:    return "UNKNOWN";
    }
}

JNIEnvGuard::JNIEnvGuard() : env_(nullptr), needs_detach_(false) {
    if (!JNILogger::jvm_) return;

    int result = JNILogger::jvm_->GetEnv((void**)&env_, JNI_VERSION_1_6);
    if (result == JNI_EDETACHED) {
        result = JNILogger::jvm_->AttachCurrentThread((void**)&env_, nullptr);
        if (result == JNI_OK) {
            needs_detach_ = true;
        } else {
            env_ = nullptr;
        }
    } else if (result != JNI_OK) {
        env_ = nullptr;
    }
}

JNIEnvGuard::~JNIEnvGuard() {
    if (needs_detach_ && JNILogger::jvm_) {
        JNILogger::jvm_->DetachCurrentThread();
    }
}
