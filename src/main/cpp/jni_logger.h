#pragma once

#include <jni.h>
#include <cstdarg>
#include <string>
#include <mutex>

/**
 * Native logger for the signature library.
 * Routes through the JVM's System.out/System.err once a VM is attached,
 * and falls back to native stderr otherwise (unit tests, pure native hosts).
 */
class JNILogger {
public:
    enum Level {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        ERROR = 3
    };

private:
    static std::mutex logger_mutex_;
    static bool initialized_;
    static Level min_level_;

    // Cached IDs for System.out / System.err println
    static jclass system_class_;
    static jfieldID out_field_;
    static jfieldID err_field_;
    static jmethodID println_method_;

public:
    static JavaVM* jvm_; // Read by JNIEnvGuard
    // Attach the logger to the VM owning env
    static bool initialize(JNIEnv* env);

    // Release the cached global refs
    static void shutdown(JNIEnv* env);

    static void set_level(Level level);
    static Level level();

    // Parses "DEBUG", "INFO", "WARN" or "ERROR"; returns false on anything else
    static bool parse_level(const std::string& name, Level* out);

    static void debug(const char* format, ...);
    static void info(const char* format, ...);
    static void warn(const char* format, ...);
    static void error(const char* format, ...);

private:
    static void vlog(Level level, const char* format, va_list args);
    static void write_jvm(Level level, const std::string& line);
    static void write_stderr(const std::string& line);
    static const char* level_string(Level level);
};

#ifdef JNISIG_DEBUG
#define JNISIG_LOG_DEBUG(fmt, ...) JNILogger::debug(fmt, ##__VA_ARGS__)
#else
#define JNISIG_LOG_DEBUG(fmt, ...)
#endif

#define JNISIG_LOG_INFO(fmt, ...)  JNILogger::info(fmt, ##__VA_ARGS__)
#define JNISIG_LOG_WARN(fmt, ...)  JNILogger::warn(fmt, ##__VA_ARGS__)
#define JNISIG_LOG_ERROR(fmt, ...) JNILogger::error(fmt, ##__VA_ARGS__)

// RAII acquisition of a JNIEnv for the current thread, attaching if needed
class JNIEnvGuard {
private:
    JNIEnv* env_;
    bool needs_detach_;

public:
    JNIEnvGuard();
    ~JNIEnvGuard();

    JNIEnvGuard(const JNIEnvGuard&) = delete;
    JNIEnvGuard& operator=(const JNIEnvGuard&) = delete;

    JNIEnv* get() const { return env_; }
    bool is_valid() const { return env_ != nullptr; }
};
