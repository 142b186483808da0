#pragma once

// ---------------------------------------------------------------------------
// policy_loader.hpp
//
// YAML 규칙 파일을 읽어 FirewallConfig 로 파싱하는 로더.
// 파일에 없는 키는 내장 기본 테이블(default_rules.cpp) 값을 유지한다.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(error_message) 반환. 호출자는 실패 시
//   기본 테이블로 계속할지, 종료할지 스스로 결정한다.
// - All-or-nothing: 부분적으로 파싱된 설정을 반환하지 않는다.
//
// [순환 의존성]
// policy_loader.hpp → rule.hpp (단방향만)
//
// [보안 고려사항]
// - 규칙 파일 경로는 환경 변수에서만 지정하고 사용자 입력을 직접 사용 금지.
// - 파싱 실패 원인은 로깅하되, YAML 파일 전체를 로그에 출력하지 않는다.
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <string>

#include "policy/rule.hpp"  // FirewallConfig

namespace YAML {
class Node;
}  // namespace YAML

class PolicyLoader {
public:
    // load
    //   지정된 경로의 YAML 파일을 읽어 FirewallConfig 로 파싱한다.
    //
    //   [YAML 스키마]
    //   global:  { log_level, audit_log_path }
    //   jql:     max_length, max_nesting_depth,
    //            allowed_fields | extra_fields, allowed_functions | extra_functions,
    //            custom_field_range: { min, max }, dangerous_patterns
    //   graphql: max_length, max_depth, max_variables, max_string_length,
    //            max_list_length, max_object_keys, max_variable_depth,
    //            allowed_fields | extra_fields, allowed_queries | extra_queries,
    //            allowed_mutations | extra_mutations, dangerous_patterns
    //
    //   allowed_* 는 내장 목록을 대체하고, extra_* 는 (대체된) 목록에 추가한다.
    //   JQL 식별자는 소문자로 정규화한다.
    //
    //   [실패 조건]
    //   파일 없음, YAML 구문 오류, 최상위가 맵이 아님, 타입 불일치,
    //   dangerous_patterns 가 빈 목록, custom_field_range.min > max.
    [[nodiscard]] static std::expected<FirewallConfig, std::string>
    load(const std::filesystem::path& config_path);

    // 이미 파싱된 YAML 루트에서 설정을 구성한다 (load 와 테스트가 공유)
    [[nodiscard]] static std::expected<FirewallConfig, std::string>
    from_yaml(const YAML::Node& root);
};
