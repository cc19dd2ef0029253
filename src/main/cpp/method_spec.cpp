#include "method_spec.h"
#include "jni_error_handler.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

InvalidArgumentException badField(const std::string& field, const std::string& reason) {
	return InvalidArgumentException(InvalidArgumentException::JSON_FIELD,
		"Invalid method spec field '" + field + "': " + reason);
}

} // namespace

MethodSpec::MethodSpec() : has_name_(false), static_(false) {}

MethodSpec MethodSpec::FromJson(const std::string& text) {
	json doc;
	try {
		doc = json::parse(text);
	} catch (const json::parse_error& e) {
		throw InvalidArgumentException(InvalidArgumentException::JSON_FIELD,
			std::string("Method spec is not valid JSON: ") + e.what());
	}
	if (!doc.is_object()) {
		throw InvalidArgumentException(InvalidArgumentException::JSON_FIELD,
			"Method spec must be a JSON object");
	}

	MethodSpec spec;

	auto name = doc.find("name");
	if (name != doc.end() && !name->is_null()) {
		if (!name->is_string()) {
			throw badField("name", "expected a string");
		}
		spec.name_ = name->get<std::string>();
		spec.has_name_ = true;
	}

	auto isStatic = doc.find("static");
	if (isStatic != doc.end()) {
		if (!isStatic->is_boolean()) {
			throw badField("static", "expected a boolean");
		}
		spec.static_ = isStatic->get<bool>();
	}

	auto returnType = doc.find("returnType");
	if (returnType != doc.end()) {
		if (!returnType->is_string()) {
			throw badField("returnType", "expected a type name");
		}
		spec.return_type_ = SimpleType::Parse(returnType->get<std::string>());
	} else {
		spec.return_type_ = SimpleType::Primitive(PrimitiveKind::Void);
	}

	if (spec.isConstructor()) {
		if (spec.static_) {
			throw badField("static", "constructors cannot be static");
		}
		if (!spec.return_type_->isPrimitive() || spec.return_type_->primitiveKind() != PrimitiveKind::Void) {
			throw badField("returnType", "constructors return void");
		}
	}

	auto params = doc.find("parameterTypes");
	if (params != doc.end()) {
		if (!params->is_array()) {
			throw badField("parameterTypes", "expected an array of type names");
		}
		for (size_t i = 0; i < params->size(); ++i) {
			const json& param = (*params)[i];
			if (!param.is_string()) {
				throw badField("parameterTypes[" + std::to_string(i) + "]", "expected a type name");
			}
			spec.parameter_types_.push_back(SimpleType::Parse(param.get<std::string>()));
		}
	}

	return spec;
}

std::string MethodSpec::signature(const SignatureGenerator& generator) const {
	SignatureGenerator::TypeList params;
	params.reserve(parameter_types_.size());
	for (const SimpleType::Ptr& type : parameter_types_) {
		params.push_back(type.get());
	}

	if (!has_name_) {
		return generator.buildSignature(return_type_.get(), params);
	}
	if (static_) {
		return generator.buildStaticMethodSignature(name_, return_type_.get(), params);
	}
	return generator.buildSignatureWithName(name_, return_type_.get(), params);
}
