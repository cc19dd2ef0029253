#pragma once

#include <jni.h>
#include <new>

// RAII wrapper for a JNI local reference frame. Every local ref created
// while the frame is alive is released when it goes out of scope.
class JNILocalFrameRAII {
private:
    JNIEnv* env_;

public:
    // Throws std::bad_alloc when the VM cannot reserve capacity refs
    JNILocalFrameRAII(JNIEnv* env, jint capacity) : env_(env) {
        if (env->PushLocalFrame(capacity) != JNI_OK) {
            env->ExceptionClear();
            throw std::bad_alloc();
        }
    }

    ~JNILocalFrameRAII() {
        env_->PopLocalFrame(nullptr);
    }

    JNILocalFrameRAII(const JNILocalFrameRAII&) = delete;
    JNILocalFrameRAII(JNILocalFrameRAII&&) = delete;
    JNILocalFrameRAII& operator=(const JNILocalFrameRAII&) = delete;
    JNILocalFrameRAII& operator=(JNILocalFrameRAII&&) = delete;
};
