#include "signature_manager.h"
#include "generator_config.h"
#include "jni_error_handler.h"
#include "jni_utils.h"
#include "local_frame.h"
#include "method_spec.h"
#include "reflected_type.h"
#include "signature_cache.h"
#include "signature_generator.h"
#include <memory>
#include <string>
#include <vector>

namespace {

// Live reflections of a native call's Class arguments. Null Class
// references stay null so the generator reports them by position.
struct ReflectedArguments {
	std::unique_ptr<ReflectedType> returnType;
	std::vector<std::unique_ptr<ReflectedType>> params;

	SignatureGenerator::TypeList paramList() const {
		SignatureGenerator::TypeList list;
		list.reserve(params.size());
		for (const auto& param : params) {
			list.push_back(param.get());
		}
		return list;
	}
};

jsize arrayLength(JNIEnv* env, jobjectArray array) {
	// A null Class[] means no parameters
	return array ? env->GetArrayLength(array) : 0;
}

ReflectedArguments reflectArguments(JNIEnv* env, jclass returnType, jobjectArray paramTypes) {
	ReflectedArguments args;
	if (returnType) {
		args.returnType.reset(new ReflectedType(env, returnType));
	}
	jsize count = arrayLength(env, paramTypes);
	args.params.reserve(count);
	for (jsize i = 0; i < count; ++i) {
		jclass param = (jclass)env->GetObjectArrayElement(paramTypes, i);
		if (env->ExceptionCheck()) {
			JNIErrorHandler::clear_exception(env);
			throw JNIException("Failed to read parameter type at index " + std::to_string(i));
		}
		args.params.emplace_back(param ? new ReflectedType(env, param) : nullptr);
	}
	return args;
}

SignatureGenerator currentGenerator() {
	return SignatureGenerator(GeneratorConfig::current().cacheEnabled ? &SignatureCache::shared() : nullptr);
}

// Room for every Class element plus the reflection calls' temporaries
jint frameCapacity(JNIEnv* env, jobjectArray paramTypes) {
	return arrayLength(env, paramTypes) + 16;
}

std::string buildMethodSignature(JNIEnv* env, jstring name, bool named, bool isStatic,
	jclass returnType, jobjectArray paramTypes) {
	std::string nameStr = JniUtils::jstring_to_string(env, name);

	SignatureGenerator generator = currentGenerator();
	JNILocalFrameRAII frame(env, frameCapacity(env, paramTypes));
	ReflectedArguments args = reflectArguments(env, returnType, paramTypes);

	if (!named) {
		return generator.buildSignature(args.returnType.get(), args.paramList());
	}
	// A null jstring converts to "" and fails the same empty-name check
	if (isStatic) {
		return generator.buildStaticMethodSignature(nameStr, args.returnType.get(), args.paramList());
	}
	return generator.buildSignatureWithName(nameStr, args.returnType.get(), args.paramList());
}

} // namespace

jstring SignatureManager::generateSignature(JNIEnv* env, jclass cls, jclass returnType, jobjectArray paramTypes) {
	JNI_TRY(env)

	std::string signature = buildMethodSignature(env, nullptr, false, false, returnType, paramTypes);
	return JniUtils::string_to_jstring(env, signature);

	JNI_CATCH_RET(env, nullptr)
}

jstring SignatureManager::generateSignatureWithMethodName(JNIEnv* env, jclass cls, jstring name,
	jclass returnType, jobjectArray paramTypes) {
	JNI_TRY(env)

	std::string signature = buildMethodSignature(env, name, true, false, returnType, paramTypes);
	return JniUtils::string_to_jstring(env, signature);

	JNI_CATCH_RET(env, nullptr)
}

jstring SignatureManager::generateConstructorSignature(JNIEnv* env, jclass cls, jobjectArray paramTypes) {
	JNI_TRY(env)

	SignatureGenerator generator = currentGenerator();
	std::string signature;
	{
		JNILocalFrameRAII frame(env, frameCapacity(env, paramTypes));
		ReflectedArguments args = reflectArguments(env, nullptr, paramTypes);
		signature = generator.buildConstructorSignature(args.paramList());
	}
	return JniUtils::string_to_jstring(env, signature);

	JNI_CATCH_RET(env, nullptr)
}

jstring SignatureManager::generateStaticMethodSignature(JNIEnv* env, jclass cls, jstring name,
	jclass returnType, jobjectArray paramTypes) {
	JNI_TRY(env)

	std::string signature = buildMethodSignature(env, name, true, true, returnType, paramTypes);
	return JniUtils::string_to_jstring(env, signature);

	JNI_CATCH_RET(env, nullptr)
}

jstring SignatureManager::generateTypeSignature(JNIEnv* env, jclass cls, jclass type) {
	JNI_TRY(env)

	if (!type) {
		JNIErrorHandler::throw_illegal_argument(env, "Type cannot be null");
		return nullptr;
	}

	SignatureGenerator generator = currentGenerator();
	std::string signature;
	{
		JNILocalFrameRAII frame(env, 16);
		ReflectedType reflected(env, type);
		signature = generator.typeSignature(&reflected);
	}
	return JniUtils::string_to_jstring(env, signature);

	JNI_CATCH_RET(env, nullptr)
}

jstring SignatureManager::generateSignatureFromJson(JNIEnv* env, jclass cls, jstring spec) {
	JNI_TRY(env)

	if (!spec) {
		JNIErrorHandler::throw_illegal_argument(env, "Method spec cannot be null");
		return nullptr;
	}

	MethodSpec method = MethodSpec::FromJson(JniUtils::jstring_to_string(env, spec));
	std::string signature = method.signature(currentGenerator());
	JNISIG_LOG_DEBUG("JSON spec resolved to %s", signature.c_str());
	return JniUtils::string_to_jstring(env, signature);

	JNI_CATCH_RET(env, nullptr)
}

void SignatureManager::configure(JNIEnv* env, jclass cls, jstring config) {
	JNI_TRY(env)

	if (!config) {
		JNIErrorHandler::throw_illegal_argument(env, "Configuration cannot be null");
		return;
	}

	GeneratorConfig::apply(GeneratorConfig::FromJson(JniUtils::jstring_to_string(env, config)));

	JNI_CATCH(env)
}

void SignatureManager::clearCache(JNIEnv* env, jclass cls) {
	SignatureCache::shared().clear();
	JNISIG_LOG_DEBUG("Signature cache cleared");
}
