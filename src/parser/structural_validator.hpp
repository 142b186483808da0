#pragma once

// ---------------------------------------------------------------------------
// structural_validator.hpp
//
// 따옴표/괄호 짝과 중첩 깊이를 파스 트리 없이 검사한다.
// JQL(괄호, 상한 3)과 GraphQL(중괄호, 상한 10)이 정책만 바꿔 공유한다.
//
// [검사 순서]
// 1. 따옴표 균형: 이스케이프되지 않은 '"' 개수가 짝수여야 한다.
//    이어서 string_quotes 로 지정된 따옴표 구간이 모두 닫혀야 한다.
//    → kUnbalancedQuotes
// 2. 구분자 균형: 문자열 구간 밖에서 여는/닫는 구분자 개수가 같고,
//    스캔 중 닫는 구분자가 여는 것보다 먼저 나오지 않아야 한다.
//    → kUnbalancedDelimiters
// 3. 중첩 깊이: tracks_depth 구분자의 최대 깊이가 max_depth 이하.
//    → kNestingTooDeep
//
// 위치 스택 없이 카운터만 유지하는 O(n) 단일 스캔이다. 균형 확인 후에는
// 짝 위치가 아니라 최대 깊이만 필요하기 때문이다.
//
// [이스케이프 규칙]
// 홀수 개의 역슬래시 뒤에 오는 따옴표는 리터럴 문자로 본다.
// escape_string_value() 가 만든 \" 가 포함된 값이 통과하도록 하기 위함.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"  // ValidationError

// ---------------------------------------------------------------------------
// DelimiterPair
//   균형 검사 대상 구분자 쌍.
//   tracks_depth == true 인 쌍만 중첩 깊이 계산에 포함된다.
// ---------------------------------------------------------------------------
struct DelimiterPair {
    char open{'('};
    char close{')'};
    bool tracks_depth{true};
};

// ---------------------------------------------------------------------------
// StructuralPolicy
//   string_quotes: 문자열 구간을 여는 따옴표 문자 목록.
//                  JQL 은 "\"'", GraphQL 은 "\"".
// ---------------------------------------------------------------------------
struct StructuralPolicy {
    std::vector<DelimiterPair> delimiters{};
    std::size_t                max_depth{3};
    std::string                string_quotes{"\""};
};

// ---------------------------------------------------------------------------
// StructuralReport
//   검사 통과 시 관측값. 테스트와 디버그 로그에서 사용한다.
// ---------------------------------------------------------------------------
struct StructuralReport {
    std::size_t quote_count{0};  // 이스케이프되지 않은 '"' 개수
    std::size_t max_depth{0};    // 관측된 최대 중첩 깊이
};

class StructuralValidator {
public:
    explicit StructuralValidator(StructuralPolicy policy);

    // check
    //   위 순서대로 검사하고 첫 번째 위반에서 즉시 반환한다.
    [[nodiscard]] std::expected<StructuralReport, ValidationError>
    check(std::string_view text) const;

    // 이스케이프되지 않은 '"' 개수
    [[nodiscard]] static std::size_t count_unescaped_quotes(std::string_view text);

    // 문자열 구간 밖의 open/close 로 계산한 최대 깊이 (균형 여부는 보지 않음)
    [[nodiscard]] static std::size_t max_nesting_depth(std::string_view text,
                                                       char             open,
                                                       char             close,
                                                       std::string_view string_quotes = "\"");

    [[nodiscard]] const StructuralPolicy& policy() const noexcept { return policy_; }

private:
    StructuralPolicy policy_;
};
