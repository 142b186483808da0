#pragma once

// ---------------------------------------------------------------------------
// variable_value.hpp
//
// GraphQL 변수 트리 표현.
// 호출자가 넘기는 variables 맵(JSON 객체)을 닫힌 변형 집합
// (null / bool / 정수 / 실수 / 문자열 / 리스트 / 맵)으로 모델링하여,
// 검증기가 구조적 재귀 한 번으로 모든 경우를 처리할 수 있게 한다.
//
// VariableMap 은 입력 순서를 보존하는 (이름, 값) 벡터다. 첫 위반을 보고할 때
// 항상 같은 변수가 지목되도록 하기 위함이다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "common/types.hpp"

namespace YAML {
class Node;
}  // namespace YAML

struct VariableValue;

using VariableList = std::vector<VariableValue>;
using VariableMap  = std::vector<std::pair<std::string, VariableValue>>;

struct VariableValue {
    using Storage = std::variant<std::nullptr_t, bool, std::int64_t, double,
                                 std::string, VariableList, VariableMap>;

    Storage data{nullptr};

    VariableValue() = default;
    VariableValue(std::nullptr_t) {}                                        // NOLINT
    VariableValue(bool v) : data(v) {}                                      // NOLINT
    VariableValue(std::int64_t v) : data(v) {}                              // NOLINT
    VariableValue(int v) : data(static_cast<std::int64_t>(v)) {}            // NOLINT
    VariableValue(double v) : data(v) {}                                    // NOLINT
    VariableValue(std::string v) : data(std::move(v)) {}                    // NOLINT
    VariableValue(const char* v) : data(std::string(v)) {}                  // NOLINT
    VariableValue(VariableList v) : data(std::move(v)) {}                   // NOLINT
    VariableValue(VariableMap v) : data(std::move(v)) {}                    // NOLINT

    [[nodiscard]] bool is_null() const noexcept   { return std::holds_alternative<std::nullptr_t>(data); }
    [[nodiscard]] bool is_string() const noexcept { return std::holds_alternative<std::string>(data); }
    [[nodiscard]] bool is_list() const noexcept   { return std::holds_alternative<VariableList>(data); }
    [[nodiscard]] bool is_map() const noexcept    { return std::holds_alternative<VariableMap>(data); }

    // 로그/오류 메시지용 타입 이름
    [[nodiscard]] std::string_view type_name() const noexcept;
};

// ---------------------------------------------------------------------------
// variables_from_yaml
//   YAML(또는 JSON) 문서의 루트 맵을 VariableMap 으로 변환한다.
//
//   [스칼라 타입 결정]
//   - 따옴표로 감싼 스칼라는 항상 문자열 ("42" 는 문자열)
//   - 그 외: null → bool → 정수 → 실수 → 문자열 순으로 해석
//
//   [오류: kUnsupportedVariableType]
//   - 루트가 맵이 아님 (null 루트는 빈 맵)
//   - 맵 키가 스칼라가 아님
//   - 정의되지 않은 노드
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<VariableMap, ValidationError>
variables_from_yaml(const YAML::Node& root);

// 문자열 전체를 YAML/JSON 으로 파싱한 뒤 variables_from_yaml 적용.
// 구문 오류도 kUnsupportedVariableType 으로 보고한다.
[[nodiscard]] std::expected<VariableMap, ValidationError>
variables_from_string(std::string_view text);
