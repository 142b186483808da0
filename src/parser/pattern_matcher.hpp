#pragma once

// ---------------------------------------------------------------------------
// pattern_matcher.hpp
//
// 정규식 패턴 목록 기반 위험 구문 탐지기.
// JQL/GraphQL 검증기가 각자의 위험 패턴 집합으로 인스턴스를 하나씩 보유하며,
// GraphQL 검증기는 변수 문자열 값 검사에도 같은 인스턴스를 재사용한다.
//
// [설계 한계 / 알려진 우회 가능성]
// 1. 인코딩 우회: URL 인코딩(%3Cscript%3E), HTML 엔티티(&lt;)는 탐지 불가.
//    원격 API 가 디코딩하지 않는 한 실제 위험은 낮다.
// 2. 대소문자 변형: icase 플래그로 완화.
// 3. 패턴은 원문에 대해 매칭한다. 문자열 리터럴 내부도 검사 대상이다.
//
// [보안 원칙]
// - 유효한 패턴이 하나도 없으면 fail-close: 모든 입력을 탐지로 보고한다.
// ---------------------------------------------------------------------------

#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// PatternMatch
//   탐지 결과.
//   matched_pattern 은 감사 로그용이며, 클라이언트 응답에는
//   reason 만 노출한다 (공격자 피드백 최소화).
// ---------------------------------------------------------------------------
struct PatternMatch {
    bool        detected{false};      // true = 위험 패턴 매칭
    std::string matched_pattern{};    // 매칭된 정규식 원문 (감사 로그용)
    std::string reason{};             // 사람이 읽을 수 있는 탐지 이유
};

// ---------------------------------------------------------------------------
// PatternMatcher
//   생성 시 패턴 목록을 ECMAScript + icase 정규식으로 컴파일하고,
//   check() 에서 첫 번째 매칭 시 즉시 반환한다.
//
//   [성능 고려사항]
//   - 생성자에서 std::regex 컴파일 비용이 발생하므로 인스턴스를 재사용할 것.
//   - O(P * N). 입력 길이 상한은 호출자(검증기 1단계)가 먼저 적용한다.
//
//   [스레드 안전성]
//   - check() 는 const 이며 컴파일된 regex 를 읽기만 하므로 동시 호출 안전.
// ---------------------------------------------------------------------------
class PatternMatcher {
public:
    // 잘못된 패턴은 spdlog::warn 후 건너뛴다.
    explicit PatternMatcher(std::vector<std::string> patterns);

    ~PatternMatcher();

    // 복사 금지 (컴파일된 regex 재사용), 이동 허용
    PatternMatcher(const PatternMatcher&)            = delete;
    PatternMatcher& operator=(const PatternMatcher&) = delete;
    PatternMatcher(PatternMatcher&&) noexcept;
    PatternMatcher& operator=(PatternMatcher&&) noexcept;

    [[nodiscard]] PatternMatch check(std::string_view text) const;

    // 유효하게 컴파일된 패턴 수 (0 이면 fail-close 상태)
    [[nodiscard]] std::size_t size() const noexcept;

    [[nodiscard]] bool fail_closed() const noexcept { return fail_close_active_; }

private:
    // std::regex 를 헤더에 노출하지 않기 위해 전방 선언만 사용.
    struct CompiledPattern;
    std::vector<CompiledPattern> compiled_patterns_;
    bool                         fail_close_active_{false};
};
