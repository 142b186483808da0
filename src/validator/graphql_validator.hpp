#pragma once

// ---------------------------------------------------------------------------
// graphql_validator.hpp
//
// 화이트리스트 기반 GraphQL 문서 방화벽.
//
// [파이프라인 — 고정 순서, 첫 위반에서 즉시 반환]
// 1. 빈 입력(kEmptyInput), 길이 상한 5000 초과(kTooLong)
// 2. 위험 패턴 스캔 (__schema, __type 등. __typename 은 허용)
// 3. 오퍼레이션 헤더 판별
//    - query / mutation / 익명 '{' (암묵적 query)
//    - subscription 또는 오퍼레이션 2개 이상 → kUnsupportedOperation
//    - 인식 가능한 오퍼레이션 없음 → kUnknownOperation
// 4. 구조 검사: 중괄호 깊이 ≤ 10, 괄호/대괄호 균형
// 5. 이름 화이트리스트 (kUnknownField)
// 6. 변수 검증 (variables 가 주어진 경우에만)
// 7. trim 된 원문 반환
//
// [이름 허용 규칙 (5단계)]
// 문자열 밖의 모든 Name 토큰은 다음 중 하나를 만족해야 한다.
//   (a) 필드 화이트리스트에 있음
//   (b) 구조 키워드 (query, mutation, fragment, on, true, false, null)
//   (c) 헤더의 오퍼레이션 이름이거나 최상위 선택(깊이 1)에 있는 이름이며,
//       검출된 오퍼레이션 타입의 화이트리스트(queries/mutations)에 있음
//   (d) 대문자로 시작하고 의심 부분 문자열(evil, hack, script)을 포함하지 않음
//       (타입/enum 참조로 간주)
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"
#include "parser/graphql_lexer.hpp"
#include "parser/pattern_matcher.hpp"
#include "parser/structural_validator.hpp"
#include "policy/rule.hpp"
#include "validator/variable_value.hpp"

enum class OperationType : std::uint8_t {
    kQuery    = 0,
    kMutation = 1,
};

// 헤더 판별 결과. name 은 익명 오퍼레이션이면 비어 있다.
struct OperationHeader {
    OperationType type{OperationType::kQuery};
    std::string   name{};
};

class GraphqlValidator {
public:
    GraphqlValidator();

    // rules 가 nullptr 이면 내장 기본 테이블을 사용한다.
    explicit GraphqlValidator(std::shared_ptr<const GraphqlRules> rules);

    ~GraphqlValidator() = default;

    GraphqlValidator(const GraphqlValidator&)            = delete;
    GraphqlValidator& operator=(const GraphqlValidator&) = delete;
    GraphqlValidator(GraphqlValidator&&)                 = default;
    GraphqlValidator& operator=(GraphqlValidator&&)      = default;

    // validate_query
    //   성공: trim 된 원문. 실패: 첫 번째 위반.
    [[nodiscard]] std::expected<std::string, ValidationError>
    validate_query(std::string_view                  document,
                   const std::optional<VariableMap>& variables = std::nullopt) const;

    // validate_for_operation
    //   validate_query 통과 후, expected_operation 이 문서에 Name 토큰으로
    //   나타나고 검출된 오퍼레이션 타입의 화이트리스트에 있는지 추가 확인한다.
    //   호출 지점이 실행할 오퍼레이션을 미리 알고 있을 때 문서 바꿔치기를 막는다.
    [[nodiscard]] std::expected<std::string, ValidationError>
    validate_for_operation(std::string_view                  document,
                           std::string_view                  expected_operation,
                           const std::optional<VariableMap>& variables = std::nullopt) const;

    // 오퍼레이션 헤더만 판별한다 (3단계 단독 실행, 진단용)
    [[nodiscard]] std::expected<OperationHeader, ValidationError>
    parse_operation_header(std::string_view document) const;

    // escape_string_value
    //   GraphQL 문자열 리터럴 삽입용. '\' '"' 와 \n \r \t 를 이스케이프하고
    //   나머지 0x20 미만 제어 문자는 제거한다.
    [[nodiscard]] static std::string escape_string_value(std::string_view value);

    [[nodiscard]] const GraphqlRules& rules() const noexcept { return *rules_; }

private:
    using StageResult = std::expected<void, ValidationError>;

    [[nodiscard]] std::expected<OperationHeader, ValidationError>
    detect_operation(const std::vector<GraphqlToken>& tokens) const;

    [[nodiscard]] StageResult check_names(const std::vector<GraphqlToken>& tokens,
                                          const OperationHeader&           header) const;

    [[nodiscard]] StageResult check_variables(const VariableMap& variables) const;

    [[nodiscard]] StageResult check_variable_value(const VariableValue& value,
                                                   const std::string&   path,
                                                   std::size_t          depth) const;

    [[nodiscard]] bool is_whitelisted_operation(const std::string& name, OperationType type) const;

    std::shared_ptr<const GraphqlRules> rules_;
    PatternMatcher                      dangerous_;
    StructuralValidator                 structural_;
    GraphqlLexer                        lexer_;
};

[[nodiscard]] std::string_view to_string(OperationType type) noexcept;

// 프로세스 전역 기본 인스턴스로 검증하는 편의 함수
[[nodiscard]] std::expected<std::string, ValidationError>
validate_graphql_query(std::string_view                  document,
                       const std::optional<VariableMap>& variables = std::nullopt);
