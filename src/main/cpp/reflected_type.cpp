#include "reflected_type.h"
#include "jni_error_handler.h"
#include "jni_utils.h"
#include <mutex>

namespace {

// java.lang.Class method IDs, looked up once per process
struct ClassMethods {
	jmethodID isPrimitive = nullptr;
	jmethodID isArray = nullptr;
	jmethodID getComponentType = nullptr;
	jmethodID getName = nullptr;

	std::once_flag initFlag;

	static ClassMethods& instance() {
		static ClassMethods s;
		return s;
	}

	// A throw leaves initFlag unset so the next caller retries
	void init(JNIEnv* env) {
		std::call_once(initFlag, [&]() {
			jclass classCls = env->FindClass("java/lang/Class");
			if (!classCls) {
				JNIErrorHandler::clear_exception(env);
				throw TypeResolutionException("java/lang/Class not found");
			}
			isPrimitive = env->GetMethodID(classCls, "isPrimitive", "()Z");
			isArray = env->GetMethodID(classCls, "isArray", "()Z");
			getComponentType = env->GetMethodID(classCls, "getComponentType", "()Ljava/lang/Class;");
			getName = env->GetMethodID(classCls, "getName", "()Ljava/lang/String;");
			env->DeleteLocalRef(classCls);

			if (!isPrimitive || !isArray || !getComponentType || !getName) {
				JNIErrorHandler::clear_exception(env);
				throw TypeResolutionException("java.lang.Class reflection methods not found");
			}
		});
	}
};

void checkCall(JNIEnv* env, const char* what) {
	if (env->ExceptionCheck()) {
		JNIErrorHandler::clear_exception(env);
		throw TypeResolutionException(std::string(what) + " threw");
	}
}

} // namespace

ReflectedType::ReflectedType(JNIEnv* env, jclass cls)
	: ReflectedType(env, cls, false) {}

ReflectedType::ReflectedType(JNIEnv* env, jclass cls, bool owns_ref)
	: env_(env), cls_(cls), owns_ref_(owns_ref), primitive_(false), array_(false), kind_(PrimitiveKind::Void) {
	if (!cls_) {
		throw InvalidArgumentException(InvalidArgumentException::TYPE_NAME, "Class reference cannot be null");
	}
	try {
		resolve();
	} catch (...) {
		if (owns_ref_) env_->DeleteLocalRef(cls_);
		throw;
	}
}

ReflectedType::~ReflectedType() {
	if (owns_ref_) {
		env_->DeleteLocalRef(cls_);
	}
}

void ReflectedType::resolve() {
	ClassMethods& methods = ClassMethods::instance();
	methods.init(env_);

	primitive_ = env_->CallBooleanMethod(cls_, methods.isPrimitive) == JNI_TRUE;
	checkCall(env_, "Class.isPrimitive()");

	if (primitive_) {
		// isPrimitive() already excluded the boxed wrappers; the name picks the kind
		std::string name = qualifiedName();
		if (!primitiveFromName(name, &kind_)) {
			throw TypeResolutionException("unknown primitive class " + name);
		}
		return;
	}

	array_ = env_->CallBooleanMethod(cls_, methods.isArray) == JNI_TRUE;
	checkCall(env_, "Class.isArray()");
}

std::shared_ptr<const TypeDescriptor> ReflectedType::componentType() const {
	if (!array_) return nullptr;

	jclass component = (jclass)env_->CallObjectMethod(cls_, ClassMethods::instance().getComponentType);
	checkCall(env_, "Class.getComponentType()");
	if (!component) {
		throw TypeResolutionException("array class without component type");
	}
	return std::shared_ptr<const TypeDescriptor>(new ReflectedType(env_, component, true));
}

std::string ReflectedType::qualifiedName() const {
	jstring name = (jstring)env_->CallObjectMethod(cls_, ClassMethods::instance().getName);
	checkCall(env_, "Class.getName()");
	if (!name) {
		throw TypeResolutionException("Class.getName() returned null");
	}
	std::string result = JniUtils::jstring_to_string(env_, name);
	env_->DeleteLocalRef(name);
	return result;
}
