#include "method_spec.h"

#include <gtest/gtest.h>

#include "jni_error_handler.h"

namespace {

class MethodSpecTest : public ::testing::Test {
protected:
	MethodSpecTest() : generator_(&cache_) {}

	std::string sig(const std::string& json) {
		return MethodSpec::FromJson(json).signature(generator_);
	}

	SignatureCache cache_;
	SignatureGenerator generator_;
};

TEST_F(MethodSpecTest, NamedStaticMethod) {
	MethodSpec spec = MethodSpec::FromJson(R"({
		"name": "main",
		"returnType": "void",
		"parameterTypes": ["java.lang.String[]", "int"],
		"static": true
	})");
	EXPECT_TRUE(spec.hasName());
	EXPECT_TRUE(spec.isStatic());
	EXPECT_FALSE(spec.isConstructor());
	EXPECT_EQ(2u, spec.parameterTypes().size());
	EXPECT_EQ("main([Ljava/lang/String;I)V", spec.signature(generator_));
}

TEST_F(MethodSpecTest, UnnamedUsesBareSignature) {
	EXPECT_EQ("(Ljava/lang/String;I)Ljava/lang/String;",
		sig(R"({"returnType": "java.lang.String", "parameterTypes": ["java.lang.String", "int"]})"));
}

TEST_F(MethodSpecTest, Defaults) {
	EXPECT_EQ("()V", sig("{}"));
	EXPECT_EQ("run()V", sig(R"({"name": "run"})"));
	EXPECT_EQ("()V", sig(R"({"name": null})"));
}

TEST_F(MethodSpecTest, BinaryTypeNames) {
	EXPECT_EQ("([[I[Ljava/lang/Object;)J",
		sig(R"({"returnType": "long", "parameterTypes": ["[[I", "[Ljava.lang.Object;"]})"));
}

TEST_F(MethodSpecTest, Constructor) {
	MethodSpec spec = MethodSpec::FromJson(R"({"name": "<init>", "parameterTypes": ["java.lang.String", "int"]})");
	EXPECT_TRUE(spec.isConstructor());
	EXPECT_EQ("<init>(Ljava/lang/String;I)V", spec.signature(generator_));

	EXPECT_THROW(MethodSpec::FromJson(R"({"name": "<init>", "returnType": "int"})"), InvalidArgumentException);
	EXPECT_THROW(MethodSpec::FromJson(R"({"name": "<init>", "static": true})"), InvalidArgumentException);
}

TEST_F(MethodSpecTest, EmptyNameRejected) {
	MethodSpec spec = MethodSpec::FromJson(R"({"name": ""})");
	try {
		spec.signature(generator_);
		FAIL() << "expected InvalidArgumentException";
	} catch (const InvalidArgumentException& e) {
		EXPECT_EQ(InvalidArgumentException::METHOD_NAME, e.argument());
	}
}

TEST_F(MethodSpecTest, EscapedNulStaysInName) {
	EXPECT_EQ(std::string("ru\0n()V", 7), sig(R"({"name": "ru\u0000n"})"));
	EXPECT_EQ(std::string("\0x()V", 5), sig(R"({"name": "\u0000x"})"));
}

TEST_F(MethodSpecTest, RejectsBadJson) {
	EXPECT_THROW(MethodSpec::FromJson("not json"), InvalidArgumentException);
	EXPECT_THROW(MethodSpec::FromJson("[]"), InvalidArgumentException);
	EXPECT_THROW(MethodSpec::FromJson(R"({"name": 5})"), InvalidArgumentException);
	EXPECT_THROW(MethodSpec::FromJson(R"({"static": "yes"})"), InvalidArgumentException);
	EXPECT_THROW(MethodSpec::FromJson(R"({"returnType": 1})"), InvalidArgumentException);
	EXPECT_THROW(MethodSpec::FromJson(R"({"parameterTypes": "int"})"), InvalidArgumentException);
	EXPECT_THROW(MethodSpec::FromJson(R"({"parameterTypes": ["int", null]})"), InvalidArgumentException);
	EXPECT_THROW(MethodSpec::FromJson(R"({"parameterTypes": ["int[", "long"]})"), InvalidArgumentException);
}

TEST_F(MethodSpecTest, FieldErrorNamesPosition) {
	try {
		MethodSpec::FromJson(R"({"parameterTypes": ["int", 3]})");
		FAIL() << "expected InvalidArgumentException";
	} catch (const InvalidArgumentException& e) {
		EXPECT_EQ(InvalidArgumentException::JSON_FIELD, e.argument());
		EXPECT_NE(std::string::npos, std::string(e.what()).find("parameterTypes[1]"));
	}
}

} // namespace
