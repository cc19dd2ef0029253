#pragma once

#include <jni.h>
#include <string>
#include <exception>
#include <new>
#include <stdexcept>
#include "jni_logger.h"

/**
 * Error types and JNI exception plumbing for the signature library.
 * Native code throws C++ exceptions; entry points convert them to
 * Java exceptions with JNI_TRY / JNI_CATCH_RET.
 */

// Base type for failures that originate in a JNI call
class JNIException : public std::runtime_error {
public:
    explicit JNIException(const std::string& msg) : std::runtime_error(msg) {}
};

// A java.lang.Class could not be inspected through reflection
class TypeResolutionException : public JNIException {
public:
    explicit TypeResolutionException(const std::string& msg)
        : JNIException("Type resolution failed: " + msg) {}
};

// Caller passed an unusable argument. Surfaces in Java as IllegalArgumentException.
class InvalidArgumentException : public std::invalid_argument {
public:
    enum Argument {
        RETURN_TYPE,
        PARAMETER_TYPE,
        METHOD_NAME,
        TYPE_NAME,
        JSON_FIELD
    };

    InvalidArgumentException(Argument argument, const std::string& msg, int index = -1)
        : std::invalid_argument(msg), argument_(argument), index_(index) {}

    Argument argument() const { return argument_; }

    // Offending parameter position, or -1 when the argument is not a parameter
    int index() const { return index_; }

    static InvalidArgumentException null_return_type();
    static InvalidArgumentException null_parameter(int index);
    static InvalidArgumentException empty_method_name();

private:
    Argument argument_;
    int index_;
};

class JNIErrorHandler {
public:
    static bool check_exception(JNIEnv* env);

    // Clear any pending Java exception, logging its class and message
    static void clear_exception(JNIEnv* env);

    static void throw_java_exception(JNIEnv* env, const char* class_name, const std::string& message);

    static void throw_runtime_exception(JNIEnv* env, const std::string& message);
    static void throw_illegal_argument(JNIEnv* env, const std::string& message);
    static void throw_out_of_memory(JNIEnv* env, const std::string& message);

    // Map a native exception onto the matching Java exception
    static void handle_native_exception(JNIEnv* env, const std::exception& e);
    static void handle_unknown_exception(JNIEnv* env);
};

#define JNI_TRY(env) \
    try {

#define JNI_CATCH(env) \
    } catch (const std::exception& e) { \
        JNIErrorHandler::handle_native_exception(env, e); \
    } catch (...) { \
        JNIErrorHandler::handle_unknown_exception(env); \
    }

#define JNI_CATCH_RET(env, ret) \
    } catch (const std::exception& e) { \
        JNIErrorHandler::handle_native_exception(env, e); \
        return ret; \
    } catch (...) { \
        JNIErrorHandler::handle_unknown_exception(env); \
        return ret; \
    }
