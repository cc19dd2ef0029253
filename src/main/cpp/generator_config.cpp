#include "generator_config.h"
#include "jni_error_handler.h"
#include <atomic>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::atomic<bool> g_cache_enabled(true);

InvalidArgumentException badField(const std::string& field, const std::string& reason) {
	return InvalidArgumentException(InvalidArgumentException::JSON_FIELD,
		"Invalid configuration field '" + field + "': " + reason);
}

} // namespace

GeneratorConfig GeneratorConfig::FromJson(const std::string& text) {
	json doc;
	try {
		doc = json::parse(text);
	} catch (const json::parse_error& e) {
		throw InvalidArgumentException(InvalidArgumentException::JSON_FIELD,
			std::string("Configuration is not valid JSON: ") + e.what());
	}
	if (!doc.is_object()) {
		throw InvalidArgumentException(InvalidArgumentException::JSON_FIELD,
			"Configuration must be a JSON object");
	}

	GeneratorConfig config;

	auto level = doc.find("logLevel");
	if (level != doc.end()) {
		if (!level->is_string()) {
			throw badField("logLevel", "expected a string");
		}
		std::string name = level->get<std::string>();
		if (!JNILogger::parse_level(name, &config.logLevel)) {
			throw badField("logLevel", "unknown level " + name);
		}
	}

	auto cache = doc.find("cacheEnabled");
	if (cache != doc.end()) {
		if (!cache->is_boolean()) {
			throw badField("cacheEnabled", "expected a boolean");
		}
		config.cacheEnabled = cache->get<bool>();
	}

	return config;
}

GeneratorConfig GeneratorConfig::current() {
	GeneratorConfig config;
	config.logLevel = JNILogger::level();
	config.cacheEnabled = g_cache_enabled.load();
	return config;
}

void GeneratorConfig::apply(const GeneratorConfig& config) {
	JNILogger::set_level(config.logLevel);
	g_cache_enabled.store(config.cacheEnabled);
	JNISIG_LOG_INFO("Configured: cacheEnabled=%s", config.cacheEnabled ? "true" : "false");
}
