#ifndef GENERATOR_CONFIG_H
#define GENERATOR_CONFIG_H

#include <string>
#include "jni_logger.h"

// Runtime settings passed from Java as JSON: {"logLevel": "WARN", "cacheEnabled": true}
struct GeneratorConfig {
	JNILogger::Level logLevel = JNILogger::INFO;
	bool cacheEnabled = true;

	// Missing keys keep their defaults; unknown keys are ignored.
	// Throws InvalidArgumentException on malformed JSON, wrong types or an unknown level.
	static GeneratorConfig FromJson(const std::string& text);

	// Current process-wide settings used by the JNI entry points
	static GeneratorConfig current();
	static void apply(const GeneratorConfig& config);
};

#endif // GENERATOR_CONFIG_H
