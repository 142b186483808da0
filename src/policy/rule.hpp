#pragma once

// ---------------------------------------------------------------------------
// rule.hpp
//
// 화이트리스트/위험 패턴/크기 상한 설정 구조체 정의.
// 기본값은 default_rules.cpp 의 내장 테이블에서 오며, yaml-cpp 를 통해
// config/rules.yaml 에서 덮어쓸 수 있다.
//
// [설계 원칙]
// - 이 헤더는 다른 프로젝트 헤더에 의존하지 않는다 (독립적).
// - 모든 멤버는 기본값을 명시하여 미초기화 동작을 방지한다.
// - 검증기는 생성 시 std::shared_ptr<const ...Rules> 로 받아 이후 절대
//   변경하지 않는다. 따라서 인스턴스는 락 없이 여러 스레드에서 공유 가능하다.
// - 이 구조체 자체는 판정 로직을 포함하지 않는다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

using IdentifierSet = std::unordered_set<std::string>;

// ---------------------------------------------------------------------------
// CustomFieldRange
//   cf[N] 형식 커스텀 필드의 허용 ID 범위 (양 끝 포함).
//   ID 를 하나씩 나열하지 않고 범위 검사로 허용한다.
// ---------------------------------------------------------------------------
struct CustomFieldRange {
    std::uint32_t min_id{10000};
    std::uint32_t max_id{99999};
};

// ---------------------------------------------------------------------------
// JqlRules
//   JQL 검증 테이블.
//   식별자 집합은 모두 소문자로 저장한다 (JQL 필드/함수/키워드는
//   대소문자 무관). 로더와 default_jql_rules() 가 이 불변식을 보장한다.
// ---------------------------------------------------------------------------
struct JqlRules {
    std::size_t              max_length{1000};        // 바이트 단위
    std::size_t              max_nesting_depth{3};    // 괄호 중첩 상한
    IdentifierSet            allowed_fields{};
    IdentifierSet            allowed_functions{};
    IdentifierSet            keywords{};              // and, or, in, is, order ...
    IdentifierSet            sql_keywords{};          // select, from, where ...
    std::vector<std::string> dangerous_patterns{};    // ECMAScript, 대소문자 무관
    CustomFieldRange         custom_field_range{};
};

// ---------------------------------------------------------------------------
// GraphqlRules
//   GraphQL 검증 테이블.
//   식별자 집합은 대소문자를 구분한다 (GraphQL 식별자 의미론).
//
//   [suspicious_substrings]
//   대문자로 시작하는 토큰은 타입/enum 참조로 보고 관대하게 허용하지만,
//   이 목록의 부분 문자열(소문자, 대소문자 무관 비교)을 포함하면 거부한다.
// ---------------------------------------------------------------------------
struct GraphqlRules {
    std::size_t              max_length{5000};
    std::size_t              max_depth{10};            // 중괄호 중첩 상한
    std::size_t              max_variables{50};
    std::size_t              max_string_length{1000};  // 변수 문자열 값
    std::size_t              max_list_length{100};     // 변수 배열 원소 수
    std::size_t              max_object_keys{50};      // 변수 객체 키 수
    std::size_t              max_variable_depth{32};   // 변수 트리 중첩 상한
    IdentifierSet            allowed_fields{};
    IdentifierSet            allowed_queries{};
    IdentifierSet            allowed_mutations{};
    IdentifierSet            structural_keywords{};    // query, mutation, fragment, on ...
    std::vector<std::string> suspicious_substrings{};
    std::vector<std::string> dangerous_patterns{};
};

// ---------------------------------------------------------------------------
// GlobalConfig
//   프로세스 전역 설정값.
//   log_level: "trace"|"debug"|"info"|"warn"|"error"|"critical"
// ---------------------------------------------------------------------------
struct GlobalConfig {
    std::string log_level{"info"};
    std::string audit_log_path{"/tmp/querywall-audit.log"};
};

// ---------------------------------------------------------------------------
// FirewallConfig
//   전체 설정의 루트 구조체. PolicyLoader::load 가 반환하는 최종 결과물.
// ---------------------------------------------------------------------------
struct FirewallConfig {
    GlobalConfig global{};
    JqlRules     jql{};
    GraphqlRules graphql{};
};

// 내장 기본 테이블 (default_rules.cpp)
[[nodiscard]] JqlRules       default_jql_rules();
[[nodiscard]] GraphqlRules   default_graphql_rules();
[[nodiscard]] FirewallConfig default_firewall_config();
