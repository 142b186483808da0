// ---------------------------------------------------------------------------
// test_variable_value.cpp
//
// VariableValue / variables_from_yaml / variables_from_string 단위 테스트
//
// [테스트 범위]
// - JSON(YAML flow) 문서 → VariableMap 변환, 입력 순서 보존
// - 따옴표 스칼라는 항상 문자열, 그 외는 bool → 정수 → 실수 → 문자열
// - 중첩 리스트/맵
// - 루트가 맵이 아님, 구문 오류, 비스칼라 키 → kUnsupportedVariableType
// ---------------------------------------------------------------------------

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <variant>

#include <yaml-cpp/yaml.h>

#include "validator/variable_value.hpp"

namespace {

const VariableValue* find(const VariableMap& map, const std::string& key) {
    for (const auto& [name, value] : map) {
        if (name == key) {
            return &value;
        }
    }
    return nullptr;
}

}  // namespace

// ---------------------------------------------------------------------------
// 1. VariableValue
// ---------------------------------------------------------------------------

TEST(VariableValueTest, TypeNames) {
    EXPECT_EQ(VariableValue{}.type_name(), "null");
    EXPECT_EQ(VariableValue{nullptr}.type_name(), "null");
    EXPECT_EQ(VariableValue{true}.type_name(), "bool");
    EXPECT_EQ(VariableValue{42}.type_name(), "int");
    EXPECT_EQ(VariableValue{2.5}.type_name(), "float");
    EXPECT_EQ(VariableValue{"text"}.type_name(), "string");
    EXPECT_EQ(VariableValue{VariableList{}}.type_name(), "list");
    EXPECT_EQ(VariableValue{VariableMap{}}.type_name(), "map");
}

TEST(VariableValueTest, Predicates) {
    const VariableValue s{"x"};
    EXPECT_TRUE(s.is_string());
    EXPECT_FALSE(s.is_null());

    const VariableValue list{VariableList{1, "two", nullptr}};
    ASSERT_TRUE(list.is_list());
    EXPECT_EQ(std::get<VariableList>(list.data).size(), 3U);

    const VariableValue map{VariableMap{{"k", "v"}}};
    EXPECT_TRUE(map.is_map());
}

// ---------------------------------------------------------------------------
// 2. JSON 문서 변환
// ---------------------------------------------------------------------------

TEST(VariablesFromString, JsonObject) {
    const auto result = variables_from_string(
        R"({"jql": "project = TEST", "limit": 10, "ratio": 1.5, "flag": true,
            "none": null, "quoted": "42", "list": [1, "a"], "obj": {"k": "v"}})");
    ASSERT_TRUE(result.has_value()) << result.error().message;
    const VariableMap& vars = *result;
    ASSERT_EQ(vars.size(), 8U);

    // 입력 순서 보존
    EXPECT_EQ(vars[0].first, "jql");
    EXPECT_EQ(vars[7].first, "obj");

    ASSERT_NE(find(vars, "jql"), nullptr);
    EXPECT_EQ(std::get<std::string>(find(vars, "jql")->data), "project = TEST");
    EXPECT_EQ(std::get<std::int64_t>(find(vars, "limit")->data), 10);
    EXPECT_DOUBLE_EQ(std::get<double>(find(vars, "ratio")->data), 1.5);
    EXPECT_TRUE(std::get<bool>(find(vars, "flag")->data));
    EXPECT_TRUE(find(vars, "none")->is_null());
    EXPECT_EQ(std::get<std::string>(find(vars, "quoted")->data), "42")
        << "quoted scalars stay strings";

    const auto& list = std::get<VariableList>(find(vars, "list")->data);
    ASSERT_EQ(list.size(), 2U);
    EXPECT_EQ(list[0].type_name(), "int");
    EXPECT_EQ(list[1].type_name(), "string");

    const auto& obj = std::get<VariableMap>(find(vars, "obj")->data);
    ASSERT_EQ(obj.size(), 1U);
    EXPECT_EQ(obj[0].first, "k");
}

TEST(VariablesFromString, PlainYamlScalars) {
    const auto result = variables_from_string("name: login test\ncount: -3\nenabled: false\n");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(std::get<std::string>(find(*result, "name")->data), "login test");
    EXPECT_EQ(std::get<std::int64_t>(find(*result, "count")->data), -3);
    EXPECT_FALSE(std::get<bool>(find(*result, "enabled")->data));
}

TEST(VariablesFromString, EmptyDocumentIsEmptyMap) {
    auto result = variables_from_string("");
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->empty());

    result = variables_from_string("{}");
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->empty());
}

// ---------------------------------------------------------------------------
// 3. 오류
// ---------------------------------------------------------------------------

TEST(VariablesFromString, NonObjectRootRejected) {
    for (const std::string doc : {"[1, 2]", "\"just a string\"", "42"}) {
        const auto result = variables_from_string(doc);
        ASSERT_FALSE(result.has_value()) << doc;
        EXPECT_EQ(result.error().code, ValidationErrorCode::kUnsupportedVariableType);
    }
}

TEST(VariablesFromString, SyntaxErrorRejected) {
    const auto result = variables_from_string(R"({"a": [1, 2)");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::kUnsupportedVariableType);
}

TEST(VariablesFromYaml, NonScalarKeyRejected) {
    const YAML::Node root = YAML::Load("? [a, b]\n: 1\n");
    const auto result = variables_from_yaml(root);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::kUnsupportedVariableType);
}

TEST(VariablesFromYaml, UndefinedNodeRejected) {
    const YAML::Node root = YAML::Load("a: 1");
    const auto result = variables_from_yaml(root["missing"]);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::kUnsupportedVariableType);
}
