// ---------------------------------------------------------------------------
// graphql_lexer.cpp
// ---------------------------------------------------------------------------

#include "parser/graphql_lexer.hpp"

#include <cctype>
#include <string>
#include <string_view>
#include <vector>

#include "common/text.hpp"

namespace {

bool is_name_start(char c) {
    return (std::isalpha(static_cast<unsigned char>(c)) != 0) || c == '_';
}

bool is_name_char(char c) {
    return (std::isalnum(static_cast<unsigned char>(c)) != 0) || c == '_';
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool is_punctuator(char c) {
    switch (c) {
        case '!': case '(': case ')': case '{': case '}': case '[': case ']':
        case ':': case '=': case '@': case '|': case '&': case ',':
            return true;
        default:
            return false;
    }
}

ValidationError unterminated(std::string_view document, std::size_t start) {
    return ValidationError{
        ValidationErrorCode::kUnbalancedQuotes,
        "unterminated string literal",
        truncate_for_log(document.substr(start), 32)
    };
}

}  // namespace

std::string_view to_string(GraphqlTokenKind kind) noexcept {
    switch (kind) {
        case GraphqlTokenKind::kName:       return "name";
        case GraphqlTokenKind::kVariable:   return "variable";
        case GraphqlTokenKind::kString:     return "string";
        case GraphqlTokenKind::kNumber:     return "number";
        case GraphqlTokenKind::kPunctuator: return "punctuator";
        case GraphqlTokenKind::kSpread:     return "spread";
        case GraphqlTokenKind::kOther:      return "other";
    }
    return "unknown";
}

std::expected<std::vector<GraphqlToken>, ValidationError>
GraphqlLexer::tokenize(std::string_view document) const {
    std::vector<GraphqlToken> tokens;
    const std::size_t len = document.size();
    std::size_t i = 0;

    while (i < len) {
        const char c = document[i];

        if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            ++i;
            continue;
        }

        // 주석
        if (c == '#') {
            while (i < len && document[i] != '\n') {
                ++i;
            }
            continue;
        }

        const std::size_t start = i;

        // 블록 문자열 """..."""
        if (document.substr(i, 3) == "\"\"\"") {
            const std::size_t end = document.find("\"\"\"", i + 3);
            if (end == std::string_view::npos) {
                return std::unexpected(unterminated(document, start));
            }
            i = end + 3;
            tokens.push_back({GraphqlTokenKind::kString,
                              std::string(document.substr(start, i - start)), start});
            continue;
        }

        // 일반 문자열
        if (c == '"') {
            ++i;
            bool closed = false;
            while (i < len) {
                if (document[i] == '\\' && i + 1 < len) {
                    i += 2;
                    continue;
                }
                if (document[i] == '"') {
                    ++i;
                    closed = true;
                    break;
                }
                ++i;
            }
            if (!closed) {
                return std::unexpected(unterminated(document, start));
            }
            tokens.push_back({GraphqlTokenKind::kString,
                              std::string(document.substr(start, i - start)), start});
            continue;
        }

        if (is_name_start(c)) {
            while (i < len && is_name_char(document[i])) {
                ++i;
            }
            tokens.push_back({GraphqlTokenKind::kName,
                              std::string(document.substr(start, i - start)), start});
            continue;
        }

        // $variable
        if (c == '$' && i + 1 < len && is_name_start(document[i + 1])) {
            ++i;
            const std::size_t name_start = i;
            while (i < len && is_name_char(document[i])) {
                ++i;
            }
            tokens.push_back({GraphqlTokenKind::kVariable,
                              std::string(document.substr(name_start, i - name_start)), start});
            continue;
        }

        if (is_digit(c) || (c == '-' && i + 1 < len && is_digit(document[i + 1]))) {
            ++i;
            while (i < len) {
                const char d = document[i];
                if (is_digit(d) || d == '.' || d == 'e' || d == 'E'
                    || ((d == '+' || d == '-') && (document[i - 1] == 'e' || document[i - 1] == 'E'))) {
                    ++i;
                    continue;
                }
                break;
            }
            tokens.push_back({GraphqlTokenKind::kNumber,
                              std::string(document.substr(start, i - start)), start});
            continue;
        }

        if (document.substr(i, 3) == "...") {
            i += 3;
            tokens.push_back({GraphqlTokenKind::kSpread, "...", start});
            continue;
        }

        ++i;
        const auto kind = is_punctuator(c) ? GraphqlTokenKind::kPunctuator : GraphqlTokenKind::kOther;
        tokens.push_back({kind, std::string(1, c), start});
    }

    return tokens;
}
