#pragma once

// ---------------------------------------------------------------------------
// graphql_lexer.hpp
//
// GraphQL 문서 단일 패스 렉서.
// 오퍼레이션 헤더 판별과 이름 화이트리스트 검사에 필요한 만큼만 토큰화한다.
// 문법 검증(선택 집합 구조, 인자 타입)은 하지 않는다.
//
// [토큰 규칙]
// - Name:     [_A-Za-z][_0-9A-Za-z]*
// - Variable: '$' + Name (kVariable, text 는 '$' 제외한 이름)
// - String:   "..." (역슬래시 이스케이프) 또는 """...""" 블록 문자열.
//             닫히지 않으면 kUnbalancedQuotes.
// - Number:   -?[0-9][0-9.eE+-]*
// - Spread:   ...
// - Punctuator: ! ( ) { } [ ] : = @ | & ,
// - '#' 부터 줄 끝까지는 주석으로 건너뛴다.
// - 그 외 문자는 kOther 한 글자.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"

enum class GraphqlTokenKind : std::uint8_t {
    kName       = 0,
    kVariable   = 1,
    kString     = 2,
    kNumber     = 3,
    kPunctuator = 4,
    kSpread     = 5,
    kOther      = 6,
};

struct GraphqlToken {
    GraphqlTokenKind kind{GraphqlTokenKind::kOther};
    std::string      text{};
    std::size_t      offset{0};

    [[nodiscard]] bool is_punct(char c) const noexcept {
        return kind == GraphqlTokenKind::kPunctuator && text.size() == 1 && text[0] == c;
    }
};

class GraphqlLexer {
public:
    [[nodiscard]] std::expected<std::vector<GraphqlToken>, ValidationError>
    tokenize(std::string_view document) const;
};

[[nodiscard]] std::string_view to_string(GraphqlTokenKind kind) noexcept;
