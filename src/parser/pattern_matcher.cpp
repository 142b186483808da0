// ---------------------------------------------------------------------------
// pattern_matcher.cpp
//
// 정규식 패턴 목록 기반 위험 구문 탐지기 구현.
//
// [CompiledPattern 구현 주의사항]
// 헤더에서 CompiledPattern 을 전방 선언만 하므로, vector<CompiledPattern> 의
// 소멸자와 이동 연산은 CompiledPattern 의 완전한 정의 이후(이 파일)에서
// 인스턴스화되어야 한다. 그래서 소멸자/이동 연산을 헤더에서 선언만 하고
// 여기서 = default 로 정의한다.
// ---------------------------------------------------------------------------

#include "parser/pattern_matcher.hpp"

#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

struct PatternMatcher::CompiledPattern {
    std::string                 source_pattern;  // 원본 패턴 문자열 (감사 로그용)
    std::shared_ptr<std::regex> compiled;        // 컴파일된 정규식
};

PatternMatcher::~PatternMatcher()                                    = default;
PatternMatcher::PatternMatcher(PatternMatcher&&) noexcept            = default;
PatternMatcher& PatternMatcher::operator=(PatternMatcher&&) noexcept = default;

// ---------------------------------------------------------------------------
// PatternMatcher 생성자
// ---------------------------------------------------------------------------
PatternMatcher::PatternMatcher(std::vector<std::string> patterns) {
    compiled_patterns_.reserve(patterns.size());

    for (auto& p : patterns) {
        try {
            auto re = std::make_shared<std::regex>(
                p,
                std::regex_constants::icase | std::regex_constants::ECMAScript
            );
            compiled_patterns_.push_back(CompiledPattern{std::move(p), std::move(re)});
        } catch (const std::regex_error& e) {
            // [보안 주의] 잘못된 패턴을 건너뛰면 탐지 범위가 줄어든다.
            // 유효한 나머지 패턴은 계속 적용한다.
            spdlog::warn(
                "pattern_matcher: invalid regex pattern '{}', skipping: {}",
                p, e.what()
            );
        }
    }

    // [Fail-close] 유효한 패턴이 없으면 check() 는 항상 detected=true.
    if (compiled_patterns_.empty()) {
        fail_close_active_ = true;
        spdlog::error(
            "pattern_matcher: no valid patterns loaded, "
            "fail-close active, every input will be rejected"
        );
    }
}

// ---------------------------------------------------------------------------
// PatternMatcher::check
// ---------------------------------------------------------------------------
PatternMatch PatternMatcher::check(std::string_view text) const {
    if (fail_close_active_) {
        return PatternMatch{true, "", "no valid patterns loaded"};
    }

    const std::string text_str(text);

    for (const auto& cp : compiled_patterns_) {
        if (!cp.compiled) {
            continue;
        }
        if (std::regex_search(text_str, *cp.compiled)) {
            return PatternMatch{
                true,
                cp.source_pattern,
                "matched dangerous pattern: " + cp.source_pattern
            };
        }
    }

    return PatternMatch{false, "", ""};
}

std::size_t PatternMatcher::size() const noexcept {
    return compiled_patterns_.size();
}
