// ---------------------------------------------------------------------------
// graphql_validator.cpp
//
// GraphQL 검증 파이프라인 구현.
//
// [오퍼레이션 헤더 판별]
// 최상위(중괄호/괄호 깊이 0) 정의만 훑는다.
//   { ... }                         → 익명 query
//   query [Name] [(...)] [@...] { } → query
//   mutation ...                    → mutation
//   fragment Name on Type { }       → 건너뜀 (오퍼레이션 아님)
//   subscription ...                → kUnsupportedOperation
// 그 외 최상위 토큰, 또는 선택 집합 { } 이 없는 정의는 kUnknownOperation.
// 키워드는 대소문자를 구분한다 (GraphQL 식별자 의미론).
//
// [선택 깊이]
// 이름 검사(5단계)의 "최상위 선택"은 괄호 밖의 중괄호만 세어 깊이 1 인
// 위치를 말한다. 인자의 객체 리터럴 {a: 1} 은 선택 깊이에 포함하지 않는다.
// ---------------------------------------------------------------------------

#include "validator/graphql_validator.hpp"

#include <cctype>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

#include "common/text.hpp"

namespace {

ValidationError make_error(ValidationErrorCode code, std::string message, std::string context = {}) {
    return ValidationError{code, std::move(message), std::move(context)};
}

StructuralPolicy graphql_structural_policy(const GraphqlRules& rules) {
    StructuralPolicy policy{};
    policy.delimiters = {
        DelimiterPair{'{', '}', true},
        DelimiterPair{'(', ')', false},
        DelimiterPair{'[', ']', false},
    };
    policy.max_depth     = rules.max_depth;
    policy.string_quotes = "\"";
    return policy;
}

std::shared_ptr<const GraphqlRules> or_default(std::shared_ptr<const GraphqlRules> rules) {
    if (rules) {
        return rules;
    }
    return std::make_shared<const GraphqlRules>(default_graphql_rules());
}

bool is_name(const GraphqlToken& token, std::string_view text) {
    return token.kind == GraphqlTokenKind::kName && token.text == text;
}

// tokens[i] 부터 괄호 깊이 0 의 첫 '{' 를 찾는다. 없으면 tokens.size().
std::size_t find_selection_open(const std::vector<GraphqlToken>& tokens, std::size_t i) {
    std::size_t parens = 0;
    for (; i < tokens.size(); ++i) {
        const auto& tok = tokens[i];
        if (tok.is_punct('(')) {
            ++parens;
        } else if (tok.is_punct(')') && parens > 0) {
            --parens;
        } else if (tok.is_punct('{') && parens == 0) {
            return i;
        }
    }
    return tokens.size();
}

// tokens[open] 이 '{' 일 때 짝이 맞는 '}' 다음 위치. 닫히지 않으면 tokens.size().
std::size_t skip_block(const std::vector<GraphqlToken>& tokens, std::size_t open) {
    std::size_t depth = 0;
    for (std::size_t i = open; i < tokens.size(); ++i) {
        if (tokens[i].is_punct('{')) {
            ++depth;
        } else if (tokens[i].is_punct('}')) {
            if (depth > 0) {
                --depth;
            }
            if (depth == 0) {
                return i + 1;
            }
        }
    }
    return tokens.size();
}

bool is_valid_variable_name(std::string_view name) {
    if (name.empty()) {
        return false;
    }
    const auto first = static_cast<unsigned char>(name.front());
    if (std::isalpha(first) == 0 && name.front() != '_') {
        return false;
    }
    for (const char c : name) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) == 0 && c != '_') {
            return false;
        }
    }
    return true;
}

bool has_uppercase_lead(const std::string& name) {
    return !name.empty() && std::isupper(static_cast<unsigned char>(name.front())) != 0;
}

}  // namespace

std::string_view to_string(OperationType type) noexcept {
    switch (type) {
        case OperationType::kQuery:    return "query";
        case OperationType::kMutation: return "mutation";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// 생성자
// ---------------------------------------------------------------------------
GraphqlValidator::GraphqlValidator()
    : GraphqlValidator(nullptr)
{}

GraphqlValidator::GraphqlValidator(std::shared_ptr<const GraphqlRules> rules)
    : rules_(or_default(std::move(rules)))
    , dangerous_(rules_->dangerous_patterns)
    , structural_(graphql_structural_policy(*rules_))
{}

// ---------------------------------------------------------------------------
// validate_query
// ---------------------------------------------------------------------------
std::expected<std::string, ValidationError>
GraphqlValidator::validate_query(std::string_view                  document,
                                 const std::optional<VariableMap>& variables) const {
    auto reject = [&](ValidationError err) -> std::expected<std::string, ValidationError> {
        spdlog::debug("graphql rejected: code={}, context={}", to_string(err.code), err.context);
        return std::unexpected(std::move(err));
    };

    // 1. 빈 입력 / 길이
    if (trim(document).empty()) {
        return reject(make_error(ValidationErrorCode::kEmptyInput, "GraphQL query cannot be empty"));
    }
    if (document.size() > rules_->max_length) {
        return reject(make_error(
            ValidationErrorCode::kTooLong,
            "GraphQL query too long (max " + std::to_string(rules_->max_length) + " characters)",
            std::to_string(document.size()) + " characters"));
    }

    // 2. 위험 패턴
    if (const PatternMatch match = dangerous_.check(document); match.detected) {
        return reject(make_error(
            ValidationErrorCode::kDangerousPattern,
            "GraphQL query contains dangerous pattern",
            match.matched_pattern));
    }

    // 3. 오퍼레이션 헤더
    auto tokens = lexer_.tokenize(document);
    if (!tokens) {
        return reject(std::move(tokens.error()));
    }
    auto header = detect_operation(*tokens);
    if (!header) {
        return reject(std::move(header.error()));
    }

    // 4. 구조
    if (auto r = structural_.check(document); !r) {
        return reject(std::move(r.error()));
    }

    // 5. 이름
    if (auto r = check_names(*tokens, *header); !r) {
        return reject(std::move(r.error()));
    }

    // 6. 변수
    if (variables.has_value()) {
        if (auto r = check_variables(*variables); !r) {
            return reject(std::move(r.error()));
        }
    }

    spdlog::trace("graphql accepted: {} {}", to_string(header->type),
                  header->name.empty() ? "<anonymous>" : header->name);
    return std::string(trim(document));
}

// ---------------------------------------------------------------------------
// validate_for_operation
// ---------------------------------------------------------------------------
std::expected<std::string, ValidationError>
GraphqlValidator::validate_for_operation(std::string_view                  document,
                                         std::string_view                  expected_operation,
                                         const std::optional<VariableMap>& variables) const {
    auto sanitized = validate_query(document, variables);
    if (!sanitized) {
        return sanitized;
    }

    // validate_query 를 통과했으므로 토큰화/헤더 판별은 실패하지 않는다
    auto tokens = lexer_.tokenize(*sanitized);
    if (!tokens) {
        return std::unexpected(std::move(tokens.error()));
    }
    auto header = detect_operation(*tokens);
    if (!header) {
        return std::unexpected(std::move(header.error()));
    }

    const std::string expected(expected_operation);
    bool present = false;
    for (const auto& tok : *tokens) {
        if (is_name(tok, expected)) {
            present = true;
            break;
        }
    }

    if (!present || !is_whitelisted_operation(expected, header->type)) {
        spdlog::debug("graphql rejected: expected operation {} not found for {}",
                      expected, to_string(header->type));
        return std::unexpected(make_error(
            ValidationErrorCode::kUnknownOperation,
            "Expected " + std::string(to_string(header->type)) + " operation not found: " + expected,
            expected));
    }
    return sanitized;
}

std::expected<OperationHeader, ValidationError>
GraphqlValidator::parse_operation_header(std::string_view document) const {
    auto tokens = lexer_.tokenize(document);
    if (!tokens) {
        return std::unexpected(std::move(tokens.error()));
    }
    return detect_operation(*tokens);
}

// ---------------------------------------------------------------------------
// escape_string_value
// ---------------------------------------------------------------------------
std::string GraphqlValidator::escape_string_value(std::string_view value) {
    std::string out;
    out.reserve(value.size() + 8);
    for (const char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) >= 0x20) {
                    out += c;
                }
                break;
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// detect_operation
// ---------------------------------------------------------------------------
std::expected<OperationHeader, ValidationError>
GraphqlValidator::detect_operation(const std::vector<GraphqlToken>& tokens) const {
    std::optional<OperationHeader> found;
    std::size_t i = 0;

    while (i < tokens.size()) {
        const GraphqlToken& tok = tokens[i];

        if (tok.is_punct('{')) {
            if (found) {
                return std::unexpected(make_error(
                    ValidationErrorCode::kUnsupportedOperation,
                    "multiple operations in one document are not supported"));
            }
            found = OperationHeader{OperationType::kQuery, {}};
            i = skip_block(tokens, i);
            continue;
        }

        if (is_name(tok, "subscription")) {
            return std::unexpected(make_error(
                ValidationErrorCode::kUnsupportedOperation,
                "Subscription operations are not allowed",
                "subscription"));
        }

        if (is_name(tok, "fragment")) {
            const std::size_t open = find_selection_open(tokens, i + 1);
            if (open == tokens.size()) {
                return std::unexpected(make_error(
                    ValidationErrorCode::kUnknownOperation,
                    "fragment definition has no selection set",
                    tok.text));
            }
            i = skip_block(tokens, open);
            continue;
        }

        if (is_name(tok, "query") || is_name(tok, "mutation")) {
            if (found) {
                return std::unexpected(make_error(
                    ValidationErrorCode::kUnsupportedOperation,
                    "multiple operations in one document are not supported",
                    tok.text));
            }
            OperationHeader header{};
            header.type = is_name(tok, "mutation") ? OperationType::kMutation : OperationType::kQuery;
            if (i + 1 < tokens.size() && tokens[i + 1].kind == GraphqlTokenKind::kName) {
                header.name = tokens[i + 1].text;
            }
            // 선택 집합 없는 헤더 ("query getTests") 는 오퍼레이션이 아니다
            const std::size_t open = find_selection_open(tokens, i + 1);
            if (open == tokens.size()) {
                return std::unexpected(make_error(
                    ValidationErrorCode::kUnknownOperation,
                    "operation has no selection set",
                    tok.text));
            }
            found = std::move(header);
            i = skip_block(tokens, open);
            continue;
        }

        return std::unexpected(make_error(
            ValidationErrorCode::kUnknownOperation,
            "Invalid GraphQL query structure",
            tok.text));
    }

    if (!found) {
        return std::unexpected(make_error(
            ValidationErrorCode::kUnknownOperation,
            "no query or mutation operation found"));
    }
    return *found;
}

// ---------------------------------------------------------------------------
// check_names
// ---------------------------------------------------------------------------
GraphqlValidator::StageResult
GraphqlValidator::check_names(const std::vector<GraphqlToken>& tokens,
                              const OperationHeader&           header) const {
    std::size_t selection_depth = 0;
    std::size_t paren_depth     = 0;

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const GraphqlToken& tok = tokens[i];

        if (tok.kind == GraphqlTokenKind::kPunctuator) {
            if (tok.is_punct('(')) {
                ++paren_depth;
            } else if (tok.is_punct(')') && paren_depth > 0) {
                --paren_depth;
            } else if (paren_depth == 0 && tok.is_punct('{')) {
                ++selection_depth;
            } else if (paren_depth == 0 && tok.is_punct('}') && selection_depth > 0) {
                --selection_depth;
            }
            continue;
        }

        if (tok.kind != GraphqlTokenKind::kName) {
            continue;
        }

        // (a) 필드, (b) 구조 키워드
        if (rules_->allowed_fields.contains(tok.text)
            || rules_->structural_keywords.contains(tok.text)) {
            continue;
        }

        // (c) 오퍼레이션 이름 위치 또는 최상위 선택
        const bool header_name_position =
            selection_depth == 0 && paren_depth == 0 && i > 0
            && (is_name(tokens[i - 1], "query") || is_name(tokens[i - 1], "mutation"));
        const bool top_level_selection = selection_depth == 1 && paren_depth == 0;
        if ((header_name_position || top_level_selection)
            && is_whitelisted_operation(tok.text, header.type)) {
            continue;
        }

        // (d) 대문자 시작 타입/enum 참조
        if (has_uppercase_lead(tok.text)) {
            bool suspicious = false;
            for (const auto& needle : rules_->suspicious_substrings) {
                if (icontains(tok.text, needle)) {
                    suspicious = true;
                    break;
                }
            }
            if (!suspicious) {
                continue;
            }
        }

        return std::unexpected(make_error(
            ValidationErrorCode::kUnknownField,
            "Unknown or disallowed field: " + tok.text,
            tok.text));
    }
    return {};
}

// ---------------------------------------------------------------------------
// 변수 검증
// ---------------------------------------------------------------------------
GraphqlValidator::StageResult GraphqlValidator::check_variables(const VariableMap& variables) const {
    if (variables.size() > rules_->max_variables) {
        return std::unexpected(make_error(
            ValidationErrorCode::kTooManyVariables,
            "Too many variables (max " + std::to_string(rules_->max_variables) + ")",
            std::to_string(variables.size()) + " variables"));
    }

    for (const auto& [name, value] : variables) {
        if (!is_valid_variable_name(name)) {
            return std::unexpected(make_error(
                ValidationErrorCode::kInvalidVariableName,
                "Invalid variable name: " + truncate_for_log(name, 64),
                truncate_for_log(name, 64)));
        }
        if (auto r = check_variable_value(value, name, 1); !r) {
            return r;
        }
    }
    return {};
}

GraphqlValidator::StageResult
GraphqlValidator::check_variable_value(const VariableValue& value,
                                       const std::string&   path,
                                       std::size_t          depth) const {
    auto too_large = [&](const std::string& what) {
        return std::unexpected(make_error(
            ValidationErrorCode::kVariableTooLarge,
            "Variable '" + path + "' " + what,
            path));
    };

    if (depth > rules_->max_variable_depth) {
        return too_large("nested too deeply");
    }

    if (const auto* s = std::get_if<std::string>(&value.data)) {
        if (s->size() > rules_->max_string_length) {
            return too_large("string value too long");
        }
        if (const PatternMatch match = dangerous_.check(*s); match.detected) {
            return std::unexpected(make_error(
                ValidationErrorCode::kDangerousPattern,
                "Variable '" + path + "' contains dangerous pattern",
                path));
        }
        return {};
    }

    if (const auto* list = std::get_if<VariableList>(&value.data)) {
        if (list->size() > rules_->max_list_length) {
            return too_large("array too large");
        }
        for (std::size_t i = 0; i < list->size(); ++i) {
            if (auto r = check_variable_value((*list)[i], path + "[" + std::to_string(i) + "]", depth + 1); !r) {
                return r;
            }
        }
        return {};
    }

    if (const auto* map = std::get_if<VariableMap>(&value.data)) {
        if (map->size() > rules_->max_object_keys) {
            return too_large("object too large");
        }
        for (const auto& [key, child] : *map) {
            if (auto r = check_variable_value(child, path + "." + key, depth + 1); !r) {
                return r;
            }
        }
        return {};
    }

    // null, bool, 정수, 실수
    return {};
}

bool GraphqlValidator::is_whitelisted_operation(const std::string& name, OperationType type) const {
    if (type == OperationType::kMutation) {
        return rules_->allowed_mutations.contains(name);
    }
    return rules_->allowed_queries.contains(name);
}

// ---------------------------------------------------------------------------
// validate_graphql_query
// ---------------------------------------------------------------------------
std::expected<std::string, ValidationError>
validate_graphql_query(std::string_view document, const std::optional<VariableMap>& variables) {
    static const GraphqlValidator validator{};
    return validator.validate_query(document, variables);
}
