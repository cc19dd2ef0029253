#include "generator_config.h"

#include <gtest/gtest.h>

#include "jni_error_handler.h"

namespace {

class GeneratorConfigTest : public ::testing::Test {
protected:
	void SetUp() override { saved_ = GeneratorConfig::current(); }
	void TearDown() override { GeneratorConfig::apply(saved_); }

	GeneratorConfig saved_;
};

TEST_F(GeneratorConfigTest, Defaults) {
	GeneratorConfig config = GeneratorConfig::FromJson("{}");
	EXPECT_EQ(JNILogger::INFO, config.logLevel);
	EXPECT_TRUE(config.cacheEnabled);
}

TEST_F(GeneratorConfigTest, ParsesFields) {
	GeneratorConfig config = GeneratorConfig::FromJson(R"({"logLevel": "ERROR", "cacheEnabled": false, "extra": 1})");
	EXPECT_EQ(JNILogger::ERROR, config.logLevel);
	EXPECT_FALSE(config.cacheEnabled);
}

TEST_F(GeneratorConfigTest, RejectsBadValues) {
	EXPECT_THROW(GeneratorConfig::FromJson("{"), InvalidArgumentException);
	EXPECT_THROW(GeneratorConfig::FromJson("42"), InvalidArgumentException);
	EXPECT_THROW(GeneratorConfig::FromJson(R"({"logLevel": "TRACE"})"), InvalidArgumentException);
	EXPECT_THROW(GeneratorConfig::FromJson(R"({"logLevel": 2})"), InvalidArgumentException);
	EXPECT_THROW(GeneratorConfig::FromJson(R"({"cacheEnabled": "no"})"), InvalidArgumentException);
}

TEST_F(GeneratorConfigTest, ApplyUpdatesCurrent) {
	GeneratorConfig config;
	config.logLevel = JNILogger::WARN;
	config.cacheEnabled = false;
	GeneratorConfig::apply(config);

	GeneratorConfig current = GeneratorConfig::current();
	EXPECT_EQ(JNILogger::WARN, current.logLevel);
	EXPECT_FALSE(current.cacheEnabled);
	EXPECT_EQ(JNILogger::WARN, JNILogger::level());
}

TEST(JNILoggerTest, ParseLevel) {
	JNILogger::Level level = JNILogger::INFO;
	EXPECT_TRUE(JNILogger::parse_level("DEBUG", &level));
	EXPECT_EQ(JNILogger::DEBUG, level);
	EXPECT_FALSE(JNILogger::parse_level("debug", &level));
	EXPECT_EQ(JNILogger::DEBUG, level);
}

TEST(JNILoggerTest, LogsWithoutVm) {
	// No JavaVM attached: lines go to stderr
	testing::internal::CaptureStderr();
	JNILogger::error("lookup %s failed", "foo");
	std::string output = testing::internal::GetCapturedStderr();
	EXPECT_NE(std::string::npos, output.find("[jnisig ERROR] lookup foo failed"));
}

} // namespace
