// ---------------------------------------------------------------------------
// test_structural_validator.cpp
//
// StructuralValidator 단위 테스트
//
// [테스트 범위]
// - 따옴표 개수/짝 검사, 이스케이프된 따옴표 처리
// - 괄호/중괄호/대괄호 균형 (닫는 것이 먼저 나오는 경우 포함)
// - 중첩 깊이 상한 (JQL 3, GraphQL 10)
// - 문자열 구간 안의 구분자 무시
// ---------------------------------------------------------------------------

#include <gtest/gtest.h>

#include <string>

#include "parser/structural_validator.hpp"

namespace {

StructuralPolicy jql_policy() {
    StructuralPolicy policy{};
    policy.delimiters    = {DelimiterPair{'(', ')', true}};
    policy.max_depth     = 3;
    policy.string_quotes = "\"'";
    return policy;
}

StructuralPolicy graphql_policy() {
    StructuralPolicy policy{};
    policy.delimiters = {
        DelimiterPair{'{', '}', true},
        DelimiterPair{'(', ')', false},
        DelimiterPair{'[', ']', false},
    };
    policy.max_depth     = 10;
    policy.string_quotes = "\"";
    return policy;
}

// "{ a { a ... } }" 를 depth 단계로 생성
std::string nested_braces(int depth) {
    std::string doc;
    for (int i = 0; i < depth; ++i) {
        doc += "{ a ";
    }
    for (int i = 0; i < depth; ++i) {
        doc += "} ";
    }
    return doc;
}

}  // namespace

// ---------------------------------------------------------------------------
// 1. 따옴표
// ---------------------------------------------------------------------------

TEST(StructuralQuotes, BalancedPasses) {
    const StructuralValidator validator(jql_policy());
    const auto report = validator.check(R"(project = "TEST" AND status = "Open")");
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->quote_count, 4U);
    EXPECT_EQ(report->max_depth, 0U);
}

TEST(StructuralQuotes, OddDoubleQuotesRejected) {
    const StructuralValidator validator(jql_policy());
    const auto report = validator.check(R"(project = "TEST)");
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, ValidationErrorCode::kUnbalancedQuotes);
    EXPECT_EQ(report.error().message, "unbalanced quotes");
}

TEST(StructuralQuotes, EscapedQuotesAreLiteral) {
    const StructuralValidator validator(jql_policy());
    const auto report = validator.check(R"(summary ~ "with \"quotes\"")");
    ASSERT_TRUE(report.has_value()) << report.error().message;
    EXPECT_EQ(report->quote_count, 2U);
    EXPECT_EQ(StructuralValidator::count_unescaped_quotes(R"(a \" b)"), 0U);
    EXPECT_EQ(StructuralValidator::count_unescaped_quotes(R"(a \\" b)"), 1U)
        << "an escaped backslash must not escape the following quote";
}

TEST(StructuralQuotes, UnterminatedSingleQuoteRejected) {
    const StructuralValidator validator(jql_policy());
    const auto report = validator.check("summary ~ 'abc");
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, ValidationErrorCode::kUnbalancedQuotes);
}

// ---------------------------------------------------------------------------
// 2. 구분자 균형
// ---------------------------------------------------------------------------

TEST(StructuralDelimiters, MissingCloseRejected) {
    const StructuralValidator validator(jql_policy());
    const auto report = validator.check(R"(project = "TEST" AND (status = "Open")");
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, ValidationErrorCode::kUnbalancedDelimiters);
}

TEST(StructuralDelimiters, ExtraCloseRejected) {
    const StructuralValidator validator(jql_policy());
    const auto report = validator.check(R"(project = "TEST" AND status = "Open"))");
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, ValidationErrorCode::kUnbalancedDelimiters);
}

TEST(StructuralDelimiters, CloseBeforeOpenRejected) {
    const StructuralValidator validator(jql_policy());
    const auto report = validator.check(") status = \"Open\" (");
    ASSERT_FALSE(report.has_value()) << "equal counts but wrong order";
    EXPECT_EQ(report.error().code, ValidationErrorCode::kUnbalancedDelimiters);
    EXPECT_EQ(report.error().context, ")");
}

TEST(StructuralDelimiters, DelimitersInsideStringsIgnored) {
    const StructuralValidator validator(jql_policy());
    EXPECT_TRUE(validator.check(R"(summary ~ "((")").has_value());
    EXPECT_TRUE(validator.check("summary ~ ')))'").has_value());
}

TEST(StructuralDelimiters, GraphqlBracketsChecked) {
    const StructuralValidator validator(graphql_policy());
    EXPECT_TRUE(validator.check("query { getTests(issueIds: [\"1\", \"2\"]) { total } }").has_value());

    const auto report = validator.check("query { getTests(issueIds: [\"1\") { total } }");
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, ValidationErrorCode::kUnbalancedDelimiters);
    EXPECT_EQ(report.error().context, "[");
}

// ---------------------------------------------------------------------------
// 3. 중첩 깊이
// ---------------------------------------------------------------------------

TEST(StructuralDepth, JqlDepthThreePasses) {
    const StructuralValidator validator(jql_policy());
    const auto report = validator.check(R"((a = "1" OR (b = "2" OR (c = "3"))))");
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->max_depth, 3U);
}

TEST(StructuralDepth, JqlDepthFourRejected) {
    const StructuralValidator validator(jql_policy());
    const auto report = validator.check(R"((a = "1" OR (b = "2" OR (c = "3" OR (d = "4")))))");
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, ValidationErrorCode::kNestingTooDeep);
    EXPECT_EQ(report.error().message, "nesting too deep (max 3 levels)");
}

TEST(StructuralDepth, GraphqlDepthLimit) {
    const StructuralValidator validator(graphql_policy());
    EXPECT_TRUE(validator.check(nested_braces(10)).has_value());

    const auto report = validator.check(nested_braces(11));
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, ValidationErrorCode::kNestingTooDeep);
}

TEST(StructuralDepth, UntrackedDelimitersDoNotCount) {
    const StructuralValidator validator(graphql_policy());
    const auto report = validator.check("{ a(x: [[[[[[[[[[[[1]]]]]]]]]]]]) }");
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->max_depth, 1U) << "brackets and parens are balance-only";
}

TEST(StructuralDepth, MaxNestingDepthHelper) {
    EXPECT_EQ(StructuralValidator::max_nesting_depth("((a)(b))", '(', ')'), 2U);
    EXPECT_EQ(StructuralValidator::max_nesting_depth(R"("(((" x)", '(', ')'), 0U);
    EXPECT_EQ(StructuralValidator::max_nesting_depth("{ { } }", '{', '}'), 2U);
}
