// ---------------------------------------------------------------------------
// jql_lexer.cpp
//
// JQL 단일 패스 렉서 구현.
// ---------------------------------------------------------------------------

#include "parser/jql_lexer.hpp"

#include <cctype>
#include <string>
#include <string_view>
#include <vector>

#include "common/text.hpp"

namespace {

bool is_ident_start(char c) {
    return (std::isalpha(static_cast<unsigned char>(c)) != 0) || c == '_';
}

bool is_ident_char(char c) {
    return (std::isalnum(static_cast<unsigned char>(c)) != 0) || c == '_';
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// 숫자 토큰 본문: 상대 날짜 단위(d, w, h)와 날짜 구분자까지 흡수
bool is_number_char(char c) {
    return (std::isalnum(static_cast<unsigned char>(c)) != 0)
        || c == '.' || c == '-' || c == '/';
}

}  // namespace

std::string_view to_string(JqlTokenKind kind) noexcept {
    switch (kind) {
        case JqlTokenKind::kIdentifier:    return "identifier";
        case JqlTokenKind::kKeyword:       return "keyword";
        case JqlTokenKind::kCustomField:   return "custom_field";
        case JqlTokenKind::kStringLiteral: return "string";
        case JqlTokenKind::kNumber:        return "number";
        case JqlTokenKind::kOperator:      return "operator";
        case JqlTokenKind::kOpen:          return "open";
        case JqlTokenKind::kClose:         return "close";
        case JqlTokenKind::kComma:         return "comma";
        case JqlTokenKind::kOther:         return "other";
    }
    return "unknown";
}

JqlLexer::JqlLexer(const IdentifierSet& keywords)
    : keywords_(&keywords)
{}

std::expected<std::vector<JqlToken>, ValidationError>
JqlLexer::tokenize(std::string_view jql) const {
    std::vector<JqlToken> tokens;
    const std::size_t len = jql.size();
    std::size_t i = 0;

    while (i < len) {
        const char c = jql[i];

        if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            ++i;
            continue;
        }

        const std::size_t start = i;

        // 문자열 리터럴
        if (c == '"' || c == '\'') {
            ++i;
            bool closed = false;
            while (i < len) {
                if (jql[i] == '\\' && i + 1 < len) {
                    i += 2;
                    continue;
                }
                if (jql[i] == c) {
                    ++i;
                    closed = true;
                    break;
                }
                ++i;
            }
            if (!closed) {
                return std::unexpected(ValidationError{
                    ValidationErrorCode::kUnbalancedQuotes,
                    "unterminated string literal",
                    truncate_for_log(jql.substr(start), 32)
                });
            }
            tokens.push_back({JqlTokenKind::kStringLiteral,
                              std::string(jql.substr(start, i - start)), start});
            continue;
        }

        // 커스텀 필드 cf[...]
        if ((c == 'c' || c == 'C') && i + 2 < len
            && (jql[i + 1] == 'f' || jql[i + 1] == 'F') && jql[i + 2] == '[') {
            i += 3;
            while (i < len && is_ident_char(jql[i])) {
                ++i;
            }
            if (i < len && jql[i] == ']') {
                ++i;
            }
            tokens.push_back({JqlTokenKind::kCustomField,
                              std::string(jql.substr(start, i - start)), start});
            continue;
        }

        // 식별자 / 키워드
        if (is_ident_start(c)) {
            while (i < len && is_ident_char(jql[i])) {
                ++i;
            }
            std::string text(jql.substr(start, i - start));
            const auto kind = keywords_->contains(to_lower(text))
                ? JqlTokenKind::kKeyword
                : JqlTokenKind::kIdentifier;
            tokens.push_back({kind, std::move(text), start});
            continue;
        }

        // 숫자 / 상대 날짜 (-7d, +1w)
        if (is_digit(c) || ((c == '-' || c == '+') && i + 1 < len && is_digit(jql[i + 1]))) {
            ++i;
            while (i < len && is_number_char(jql[i])) {
                ++i;
            }
            tokens.push_back({JqlTokenKind::kNumber,
                              std::string(jql.substr(start, i - start)), start});
            continue;
        }

        // 두 글자 연산자
        if (i + 1 < len) {
            const std::string_view two = jql.substr(i, 2);
            if (two == "!=" || two == "!~" || two == ">=" || two == "<=") {
                i += 2;
                tokens.push_back({JqlTokenKind::kOperator, std::string(two), start});
                continue;
            }
        }

        ++i;
        switch (c) {
            case '=':
            case '>':
            case '<':
            case '~':
                tokens.push_back({JqlTokenKind::kOperator, std::string(1, c), start});
                break;
            case '(':
                tokens.push_back({JqlTokenKind::kOpen, "(", start});
                break;
            case ')':
                tokens.push_back({JqlTokenKind::kClose, ")", start});
                break;
            case ',':
                tokens.push_back({JqlTokenKind::kComma, ",", start});
                break;
            default:
                tokens.push_back({JqlTokenKind::kOther, std::string(1, c), start});
                break;
        }
    }

    return tokens;
}
