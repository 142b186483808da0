// ---------------------------------------------------------------------------
// structural_validator.cpp
//
// 따옴표/구분자 균형 및 중첩 깊이 검사 구현.
// ---------------------------------------------------------------------------

#include "parser/structural_validator.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

// text[pos] 앞에 연속된 역슬래시가 홀수 개이면 이스케이프된 문자다.
bool is_escaped(std::string_view text, std::size_t pos) {
    std::size_t backslashes = 0;
    while (pos > 0 && text[pos - 1] == '\\') {
        ++backslashes;
        --pos;
    }
    return (backslashes % 2) == 1;
}

// 문자열 구간 밖의 문자마다 fn(index, ch) 를 호출한다.
// 반환값: 스캔이 문자열 구간 밖에서 끝났으면 true.
template <typename Fn>
bool for_each_code_char(std::string_view text, std::string_view quotes, Fn&& fn) {
    char in_quote = '\0';
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char ch = text[i];
        if (in_quote != '\0') {
            if (ch == in_quote && !is_escaped(text, i)) {
                in_quote = '\0';
            }
            continue;
        }
        if (quotes.find(ch) != std::string_view::npos && !is_escaped(text, i)) {
            in_quote = ch;
            continue;
        }
        fn(i, ch);
    }
    return in_quote == '\0';
}

ValidationError make_error(ValidationErrorCode code, std::string message, std::string context = {}) {
    return ValidationError{code, std::move(message), std::move(context)};
}

}  // namespace

StructuralValidator::StructuralValidator(StructuralPolicy policy)
    : policy_(std::move(policy))
{}

std::size_t StructuralValidator::count_unescaped_quotes(std::string_view text) {
    std::size_t count = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '"' && !is_escaped(text, i)) {
            ++count;
        }
    }
    return count;
}

std::size_t StructuralValidator::max_nesting_depth(std::string_view text,
                                                   char             open,
                                                   char             close,
                                                   std::string_view string_quotes) {
    std::size_t depth     = 0;
    std::size_t max_depth = 0;
    (void)for_each_code_char(text, string_quotes, [&](std::size_t, char ch) {
        if (ch == open) {
            ++depth;
            max_depth = std::max(max_depth, depth);
        } else if (ch == close && depth > 0) {
            --depth;
        }
    });
    return max_depth;
}

// ---------------------------------------------------------------------------
// StructuralValidator::check
// ---------------------------------------------------------------------------
std::expected<StructuralReport, ValidationError>
StructuralValidator::check(std::string_view text) const {
    StructuralReport report{};

    // 1. '"' 개수 짝수 검사
    report.quote_count = count_unescaped_quotes(text);
    if (report.quote_count % 2 != 0) {
        return std::unexpected(make_error(
            ValidationErrorCode::kUnbalancedQuotes,
            "unbalanced quotes",
            std::to_string(report.quote_count) + " double quotes"
        ));
    }

    // 2. 단일 스캔: 구분자 카운터 + 추적 깊이
    std::vector<std::size_t> depths(policy_.delimiters.size(), 0);
    std::size_t tracked_depth = 0;
    bool        close_before_open = false;
    char        offending = '\0';

    const bool strings_closed = for_each_code_char(
        text, policy_.string_quotes,
        [&](std::size_t, char ch) {
            for (std::size_t d = 0; d < policy_.delimiters.size(); ++d) {
                const auto& pair = policy_.delimiters[d];
                if (ch == pair.open) {
                    ++depths[d];
                    if (pair.tracks_depth) {
                        ++tracked_depth;
                        report.max_depth = std::max(report.max_depth, tracked_depth);
                    }
                } else if (ch == pair.close) {
                    if (depths[d] == 0) {
                        // 여는 구분자보다 닫는 구분자가 먼저 나옴
                        if (!close_before_open) {
                            close_before_open = true;
                            offending = ch;
                        }
                        continue;
                    }
                    --depths[d];
                    if (pair.tracks_depth) {
                        --tracked_depth;
                    }
                }
            }
        });

    if (!strings_closed) {
        return std::unexpected(make_error(
            ValidationErrorCode::kUnbalancedQuotes,
            "unterminated string literal"
        ));
    }

    if (close_before_open) {
        return std::unexpected(make_error(
            ValidationErrorCode::kUnbalancedDelimiters,
            std::string("unbalanced delimiters: '") + offending + "' without matching open",
            std::string(1, offending)
        ));
    }

    for (std::size_t d = 0; d < depths.size(); ++d) {
        if (depths[d] != 0) {
            const auto& pair = policy_.delimiters[d];
            return std::unexpected(make_error(
                ValidationErrorCode::kUnbalancedDelimiters,
                std::string("unbalanced delimiters: '") + pair.open + "' without matching '"
                    + pair.close + "'",
                std::string(1, pair.open)
            ));
        }
    }

    // 3. 중첩 깊이 상한
    if (report.max_depth > policy_.max_depth) {
        return std::unexpected(make_error(
            ValidationErrorCode::kNestingTooDeep,
            "nesting too deep (max " + std::to_string(policy_.max_depth) + " levels)",
            "depth " + std::to_string(report.max_depth)
        ));
    }

    spdlog::trace("structural_validator: quotes={}, max_depth={}",
                  report.quote_count, report.max_depth);
    return report;
}
