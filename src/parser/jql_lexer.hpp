#pragma once

// ---------------------------------------------------------------------------
// jql_lexer.hpp
//
// JQL 단일 패스 렉서. 화이트리스트 로직이 돌기 전에 평탄한 토큰 스트림을
// 만든다. 필드/함수/키워드 분류는 "토큰 종류 + 바로 다음 토큰" 조회로
// 충분하므로 파스 트리는 만들지 않는다.
//
// [토큰 규칙]
// - 문자열: "..." 또는 '...', 역슬래시 이스케이프 허용. 닫히지 않으면
//   kUnbalancedQuotes 오류.
// - 커스텀 필드: cf[ 로 시작 (대소문자 무관). 닫는 ']' 가 없거나 내용이
//   숫자가 아니어도 kCustomField 로 만들고, 판정은 검증기에 맡긴다.
// - 식별자: [A-Za-z_][A-Za-z0-9_]*. keywords 집합(소문자)에 있으면 kKeyword.
// - 숫자/상대 날짜: 숫자 또는 부호+숫자로 시작, 이후 [A-Za-z0-9./-]* 흡수.
//   (-7d, 2024-01-01, 1.5)
// - 연산자: = != > >= < <= ~ !~
// - ( ) , 는 각각 kOpen / kClose / kComma. 그 외 문자는 kOther 한 글자.
//
// [한계]
// - 공백이 포함된 따옴표 필드명("Story Points" = 5)은 문자열 토큰이 되며,
//   검증기는 이를 필드로 인정하지 않는다 (화이트리스트 우회 방지).
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"
#include "policy/rule.hpp"  // IdentifierSet

enum class JqlTokenKind : std::uint8_t {
    kIdentifier    = 0,
    kKeyword       = 1,
    kCustomField   = 2,
    kStringLiteral = 3,
    kNumber        = 4,
    kOperator      = 5,
    kOpen          = 6,
    kClose         = 7,
    kComma         = 8,
    kOther         = 9,
};

struct JqlToken {
    JqlTokenKind kind{JqlTokenKind::kOther};
    std::string  text{};        // 원문 그대로 (문자열은 따옴표 포함)
    std::size_t  offset{0};     // 원문 내 시작 위치
};

class JqlLexer {
public:
    // keywords: 소문자 키워드 집합. 렉서보다 오래 살아야 한다
    // (검증기가 소유한 JqlRules 를 가리킨다).
    explicit JqlLexer(const IdentifierSet& keywords);

    [[nodiscard]] std::expected<std::vector<JqlToken>, ValidationError>
    tokenize(std::string_view jql) const;

private:
    const IdentifierSet* keywords_;
};

// 디버그/테스트 출력용
[[nodiscard]] std::string_view to_string(JqlTokenKind kind) noexcept;
