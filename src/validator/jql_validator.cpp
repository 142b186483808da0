// ---------------------------------------------------------------------------
// jql_validator.cpp
//
// JQL 검증 파이프라인 구현.
//
// [필드 분류 규칙 — 토큰 종류 + 바로 다음 토큰]
// - 식별자 다음이 '(' 이면 함수 호출. 필드 검사에서 제외.
// - 식별자 다음이 비교 연산자(= != > >= < <= ~ !~) 이면 필드.
// - 식별자 다음이 in / is / was / changed, 또는 not in / not changed 이면 필드.
// - ORDER BY 뒤의 정렬 컬럼(쉼표로 구분)도 필드.
// - 비교 연산자의 왼쪽 피연산자는 반드시 필드여야 한다.
//   '1'='1', 1=1 같은 tautology 는 kUnknownField 로 거부된다.
//
// 괄호 안의 내용도 같은 규칙으로 검사한다.
// (project = "A" AND (badField = "x")) 의 badField 가 빠져나가지 않는다.
// ---------------------------------------------------------------------------

#include "validator/jql_validator.hpp"

#include <charconv>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "common/text.hpp"

namespace {

ValidationError make_error(ValidationErrorCode code, std::string message, std::string context = {}) {
    return ValidationError{code, std::move(message), std::move(context)};
}

StructuralPolicy jql_structural_policy(const JqlRules& rules) {
    StructuralPolicy policy{};
    policy.delimiters    = {DelimiterPair{'(', ')', true}};
    policy.max_depth     = rules.max_nesting_depth;
    policy.string_quotes = "\"'";
    return policy;
}

std::shared_ptr<const JqlRules> or_default(std::shared_ptr<const JqlRules> rules) {
    if (rules) {
        return rules;
    }
    return std::make_shared<const JqlRules>(default_jql_rules());
}

bool is_keyword(const JqlToken& token, std::string_view lower_word) {
    return token.kind == JqlTokenKind::kKeyword && to_lower(token.text) == lower_word;
}

// 필드를 앞에 두는 키워드 연산자
bool is_field_predicate(const JqlToken& token) {
    return is_keyword(token, "in") || is_keyword(token, "is")
        || is_keyword(token, "was") || is_keyword(token, "changed");
}

}  // namespace

// ---------------------------------------------------------------------------
// 생성자
// ---------------------------------------------------------------------------
JqlValidator::JqlValidator()
    : JqlValidator(nullptr)
{}

JqlValidator::JqlValidator(std::shared_ptr<const JqlRules> rules)
    : rules_(or_default(std::move(rules)))
    , dangerous_(rules_->dangerous_patterns)
    , structural_(jql_structural_policy(*rules_))
    , lexer_(rules_->keywords)
{}

// ---------------------------------------------------------------------------
// validate_and_sanitize
// ---------------------------------------------------------------------------
std::expected<std::string, ValidationError>
JqlValidator::validate_and_sanitize(std::string_view jql) const {
    auto reject = [&](ValidationError err) -> std::expected<std::string, ValidationError> {
        spdlog::debug("jql rejected: code={}, context={}", to_string(err.code), err.context);
        return std::unexpected(std::move(err));
    };

    // 1. 빈 입력 / 길이
    if (auto r = check_input_bounds(jql); !r) {
        return reject(std::move(r.error()));
    }

    // 2. 위험 패턴
    if (auto r = check_dangerous_patterns(jql); !r) {
        return reject(std::move(r.error()));
    }

    // 3. 구조
    if (auto r = structural_.check(jql); !r) {
        return reject(std::move(r.error()));
    }

    auto tokens = lexer_.tokenize(jql);
    if (!tokens) {
        return reject(std::move(tokens.error()));
    }

    // 4. 필드
    if (auto r = check_fields(*tokens); !r) {
        return reject(std::move(r.error()));
    }

    // 5. 함수
    if (auto r = check_functions(*tokens); !r) {
        return reject(std::move(r.error()));
    }

    // 6. SQL 키워드
    if (auto r = check_sql_keywords(*tokens); !r) {
        return reject(std::move(r.error()));
    }

    // 7. trim 된 원문
    return std::string(trim(jql));
}

// ---------------------------------------------------------------------------
// escape_string_value
// ---------------------------------------------------------------------------
std::string JqlValidator::escape_string_value(std::string_view value) {
    std::string out;
    out.reserve(value.size() + 8);
    for (const char c : value) {
        if (c == '\\') {
            out += "\\\\";
        } else if (c == '"') {
            out += "\\\"";
        } else if (static_cast<unsigned char>(c) < 0x20) {
            continue;
        } else {
            out += c;
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// 단계별 검사
// ---------------------------------------------------------------------------
JqlValidator::StageResult JqlValidator::check_input_bounds(std::string_view jql) const {
    if (trim(jql).empty()) {
        return std::unexpected(make_error(
            ValidationErrorCode::kEmptyInput, "JQL query cannot be empty"));
    }
    if (jql.size() > rules_->max_length) {
        return std::unexpected(make_error(
            ValidationErrorCode::kTooLong,
            "JQL query too long (max " + std::to_string(rules_->max_length) + " characters)",
            std::to_string(jql.size()) + " characters"));
    }
    return {};
}

JqlValidator::StageResult JqlValidator::check_dangerous_patterns(std::string_view jql) const {
    const PatternMatch match = dangerous_.check(jql);
    if (match.detected) {
        return std::unexpected(make_error(
            ValidationErrorCode::kDangerousPattern,
            "JQL query contains dangerous patterns",
            match.matched_pattern));
    }
    return {};
}

JqlValidator::StageResult JqlValidator::check_fields(const std::vector<JqlToken>& tokens) const {
    auto unknown_field = [](const std::string& name) {
        return std::unexpected(make_error(
            ValidationErrorCode::kUnknownField,
            "Unknown or disallowed field: " + name,
            name));
    };

    bool in_order_by     = false;
    bool expect_column   = false;

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const JqlToken& tok = tokens[i];
        const JqlToken* next = (i + 1 < tokens.size()) ? &tokens[i + 1] : nullptr;

        // ORDER BY 진입
        if (is_keyword(tok, "order") && next != nullptr && is_keyword(*next, "by")) {
            in_order_by   = true;
            expect_column = true;
            ++i;
            continue;
        }

        // 커스텀 필드는 위치와 무관하게 형식/범위 검사
        if (tok.kind == JqlTokenKind::kCustomField) {
            if (!is_valid_custom_field(tok.text)) {
                return unknown_field(tok.text);
            }
            expect_column = false;
            continue;
        }

        // 비교 연산자의 왼쪽 피연산자
        if (tok.kind == JqlTokenKind::kOperator) {
            if (i == 0) {
                return unknown_field(tok.text);
            }
            const JqlToken& lhs = tokens[i - 1];
            if (lhs.kind != JqlTokenKind::kIdentifier && lhs.kind != JqlTokenKind::kCustomField) {
                return unknown_field(lhs.text);
            }
            continue;
        }

        if (tok.kind == JqlTokenKind::kComma) {
            expect_column = in_order_by;
            continue;
        }

        if (tok.kind != JqlTokenKind::kIdentifier) {
            expect_column = false;
            continue;
        }

        // 함수 호출
        if (next != nullptr && next->kind == JqlTokenKind::kOpen) {
            expect_column = false;
            continue;
        }

        bool is_field = expect_column;
        if (next != nullptr) {
            if (next->kind == JqlTokenKind::kOperator || is_field_predicate(*next)) {
                is_field = true;
            } else if (is_keyword(*next, "not") && i + 2 < tokens.size()
                       && (is_keyword(tokens[i + 2], "in") || is_keyword(tokens[i + 2], "changed"))) {
                is_field = true;
            }
        }
        expect_column = false;

        if (is_field && !is_allowed_field(tok.text)) {
            return unknown_field(tok.text);
        }
    }
    return {};
}

JqlValidator::StageResult JqlValidator::check_functions(const std::vector<JqlToken>& tokens) const {
    for (std::size_t i = 0; i + 1 < tokens.size(); ++i) {
        const JqlToken& tok = tokens[i];
        if (tok.kind != JqlTokenKind::kIdentifier || tokens[i + 1].kind != JqlTokenKind::kOpen) {
            continue;
        }
        if (!rules_->allowed_functions.contains(to_lower(tok.text))) {
            return std::unexpected(make_error(
                ValidationErrorCode::kUnknownFunction,
                "Unknown or disallowed function: " + tok.text,
                tok.text));
        }
    }
    return {};
}

JqlValidator::StageResult JqlValidator::check_sql_keywords(const std::vector<JqlToken>& tokens) const {
    for (const auto& tok : tokens) {
        if (tok.kind != JqlTokenKind::kIdentifier) {
            continue;
        }
        const std::string lower = to_lower(tok.text);
        if (rules_->sql_keywords.contains(lower)) {
            return std::unexpected(make_error(
                ValidationErrorCode::kSqlKeywordNotAllowed,
                "SQL keyword not allowed in JQL: " + lower,
                lower));
        }
    }
    return {};
}

// ---------------------------------------------------------------------------
// 헬퍼
// ---------------------------------------------------------------------------
bool JqlValidator::is_allowed_field(const std::string& name) const {
    return rules_->allowed_fields.contains(to_lower(name));
}

// cf[N]: 대소문자 무관 접두사, 닫는 ']' 필수, N 은 1~9 자리 숫자, 범위 내
bool JqlValidator::is_valid_custom_field(std::string_view token) const {
    if (token.size() < 5 || token.back() != ']') {
        return false;
    }
    const std::string_view digits = token.substr(3, token.size() - 4);
    if (digits.empty() || digits.size() > 9) {
        return false;
    }
    std::uint32_t id = 0;
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), id);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return false;
    }
    return id >= rules_->custom_field_range.min_id && id <= rules_->custom_field_range.max_id;
}

// ---------------------------------------------------------------------------
// validate_jql
// ---------------------------------------------------------------------------
std::expected<std::string, ValidationError> validate_jql(std::string_view jql) {
    static const JqlValidator validator{};
    return validator.validate_and_sanitize(jql);
}
