// ---------------------------------------------------------------------------
// policy_loader.cpp
//
// YAML 규칙 파일을 로드하여 FirewallConfig 구조체로 파싱한다.
//
// [설계 원칙]
// - All-or-nothing: 파싱 실패 시 부분 설정을 반환하지 않는다.
// - 섹션별 try-catch: 타입 불일치(YAML::TypedBadConversion)는 해당 섹션
//   이름을 담은 오류로 변환된다.
// - YAML 파일 전체를 로그에 출력하지 않는다.
//
// [fail-close 연계 — dangerous_patterns 최소 1개 검증]
// dangerous_patterns 키가 빈 목록이면 오류를 반환한다. 빈 목록이 그대로
// PatternMatcher 에 전달되면 fail-close 상태가 되어 모든 쿼리가 거부된다.
// 운영자의 설정 실수를 로드 시점에 드러내기 위함이다.
//
// [오탐/미탐 트레이드오프]
// - 잘못된 regex 패턴은 PatternMatcher 가 건너뛰므로 해당 패턴의 탐지가
//   누락된다 (false negative). 로드 시점에 경고 로그를 출력한다.
// ---------------------------------------------------------------------------

#include "policy/policy_loader.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <regex>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "common/text.hpp"

namespace {

// 설정 오류를 예외로 올려 섹션 단위 catch 에서 메시지로 변환한다
struct ConfigError {
    std::string message;
};

// ---------------------------------------------------------------------------
// 내부 헬퍼: regex 패턴이 유효한지 사전 검증하고 경고 로그를 출력한다.
// PatternMatcher 생성 시에도 같은 경고가 나올 수 있으나, 로드 시점 조기
// 감지가 더 중요하다.
// ---------------------------------------------------------------------------
void validate_patterns(const char* section, const std::vector<std::string>& patterns) {
    for (const auto& p : patterns) {
        try {
            std::regex re(p, std::regex_constants::icase | std::regex_constants::ECMAScript);
            (void)re;  // 컴파일만 확인
        } catch (const std::regex_error& e) {
            spdlog::warn(
                "policy_loader: {}.dangerous_patterns entry '{}' is invalid regex and will be "
                "skipped (false negative risk): {}",
                section, p, e.what()
            );
        }
    }
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 string 벡터를 읽는다.
// 노드가 sequence 가 아니면 ConfigError.
// ---------------------------------------------------------------------------
[[nodiscard]] std::vector<std::string> read_string_sequence(const YAML::Node& node, const char* key) {
    if (!node.IsSequence()) {
        throw ConfigError{std::string(key) + " must be a sequence"};
    }
    std::vector<std::string> result;
    result.reserve(node.size());
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            throw ConfigError{std::string(key) + " entries must be scalars"};
        }
        result.push_back(item.as<std::string>());
    }
    return result;
}

[[nodiscard]] std::size_t read_size(const YAML::Node& node, std::size_t fallback) {
    if (!node) {
        return fallback;
    }
    return node.as<std::size_t>();
}

[[nodiscard]] std::string read_string(const YAML::Node& node, const std::string& fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    return node.as<std::string>();
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 식별자 집합 갱신
//   replace_key 가 있으면 목록 전체를 대체하고, extra_key 는 추가한다.
// ---------------------------------------------------------------------------
void merge_identifiers(IdentifierSet&    target,
                       const YAML::Node& section,
                       const char*       replace_key,
                       const char*       extra_key,
                       bool              lowercase) {
    auto normalize = [lowercase](const std::string& s) {
        return lowercase ? to_lower(s) : s;
    };

    if (const YAML::Node replace = section[replace_key]) {
        target.clear();
        for (const auto& s : read_string_sequence(replace, replace_key)) {
            target.insert(normalize(s));
        }
    }
    if (const YAML::Node extra = section[extra_key]) {
        for (const auto& s : read_string_sequence(extra, extra_key)) {
            target.insert(normalize(s));
        }
    }
}

void read_dangerous_patterns(std::vector<std::string>& target, const YAML::Node& section) {
    const YAML::Node node = section["dangerous_patterns"];
    if (!node) {
        return;
    }
    auto patterns = read_string_sequence(node, "dangerous_patterns");
    if (patterns.empty()) {
        throw ConfigError{"dangerous_patterns must have at least one pattern "
                          "(fail-close: empty pattern list would reject every query)"};
    }
    target = std::move(patterns);
}

// ---------------------------------------------------------------------------
// 섹션 파서
// ---------------------------------------------------------------------------
void parse_global(GlobalConfig& cfg, const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return;
    }
    if (!node.IsMap()) {
        throw ConfigError{"must be a map"};
    }
    cfg.log_level      = read_string(node["log_level"],      cfg.log_level);
    cfg.audit_log_path = read_string(node["audit_log_path"], cfg.audit_log_path);
}

void parse_jql(JqlRules& rules, const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return;
    }
    if (!node.IsMap()) {
        throw ConfigError{"must be a map"};
    }

    rules.max_length        = read_size(node["max_length"],        rules.max_length);
    rules.max_nesting_depth = read_size(node["max_nesting_depth"], rules.max_nesting_depth);

    merge_identifiers(rules.allowed_fields,    node, "allowed_fields",    "extra_fields",    true);
    merge_identifiers(rules.allowed_functions, node, "allowed_functions", "extra_functions", true);

    if (const YAML::Node range = node["custom_field_range"]) {
        if (!range.IsMap()) {
            throw ConfigError{"custom_field_range must be a map"};
        }
        if (range["min"]) {
            rules.custom_field_range.min_id = range["min"].as<std::uint32_t>();
        }
        if (range["max"]) {
            rules.custom_field_range.max_id = range["max"].as<std::uint32_t>();
        }
        if (rules.custom_field_range.min_id > rules.custom_field_range.max_id) {
            throw ConfigError{"custom_field_range.min must not exceed custom_field_range.max"};
        }
    }

    read_dangerous_patterns(rules.dangerous_patterns, node);
}

void parse_graphql(GraphqlRules& rules, const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return;
    }
    if (!node.IsMap()) {
        throw ConfigError{"must be a map"};
    }

    rules.max_length         = read_size(node["max_length"],         rules.max_length);
    rules.max_depth          = read_size(node["max_depth"],          rules.max_depth);
    rules.max_variables      = read_size(node["max_variables"],      rules.max_variables);
    rules.max_string_length  = read_size(node["max_string_length"],  rules.max_string_length);
    rules.max_list_length    = read_size(node["max_list_length"],    rules.max_list_length);
    rules.max_object_keys    = read_size(node["max_object_keys"],    rules.max_object_keys);
    rules.max_variable_depth = read_size(node["max_variable_depth"], rules.max_variable_depth);

    merge_identifiers(rules.allowed_fields,    node, "allowed_fields",    "extra_fields",    false);
    merge_identifiers(rules.allowed_queries,   node, "allowed_queries",   "extra_queries",   false);
    merge_identifiers(rules.allowed_mutations, node, "allowed_mutations", "extra_mutations", false);

    read_dangerous_patterns(rules.dangerous_patterns, node);
}

// 섹션 하나를 파싱하고 실패 원인을 섹션 이름이 붙은 메시지로 변환한다
template <typename Fn>
[[nodiscard]] std::expected<void, std::string> parse_section(const char* name, Fn&& fn) {
    try {
        fn();
    } catch (const ConfigError& e) {
        return std::unexpected(fmt::format(
            "policy_loader: invalid '{}' section: {}", name, e.message));
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format(
            "policy_loader: error parsing '{}' section: {}", name, e.what()));
    }
    return {};
}

}  // namespace

// ---------------------------------------------------------------------------
// PolicyLoader::load 구현
// ---------------------------------------------------------------------------
std::expected<FirewallConfig, std::string>
PolicyLoader::load(const std::filesystem::path& config_path) {
    // 1. 경로 정규화
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        const std::string err = fmt::format(
            "policy_loader: cannot resolve config path '{}': {}",
            config_path.string(), ec.message()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("policy_loader: loading rules from '{}'", canonical_path.string());

    // 2. YAML 파일 로드 (yaml-cpp 예외 처리)
    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        const std::string err = fmt::format(
            "policy_loader: cannot open file '{}': {}",
            canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "policy_loader: YAML parse error in '{}' at line {}, col {}: {}",
            canonical_path.string(),
            e.mark.line + 1,   // yaml-cpp 는 0-based
            e.mark.column + 1,
            e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "policy_loader: YAML error in '{}': {}",
            canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    return from_yaml(root);
}

std::expected<FirewallConfig, std::string>
PolicyLoader::from_yaml(const YAML::Node& root) {
    if (!root || !root.IsMap()) {
        const std::string err = "policy_loader: rules document is not a valid YAML map (top-level)";
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    FirewallConfig cfg = default_firewall_config();

    auto fail = [](const std::string& err) -> std::expected<FirewallConfig, std::string> {
        spdlog::error("{}", err);
        return std::unexpected(err);
    };

    if (auto r = parse_section("global", [&] { parse_global(cfg.global, root["global"]); }); !r) {
        return fail(r.error());
    }
    if (auto r = parse_section("jql", [&] { parse_jql(cfg.jql, root["jql"]); }); !r) {
        return fail(r.error());
    }
    if (auto r = parse_section("graphql", [&] { parse_graphql(cfg.graphql, root["graphql"]); }); !r) {
        return fail(r.error());
    }

    validate_patterns("jql",     cfg.jql.dangerous_patterns);
    validate_patterns("graphql", cfg.graphql.dangerous_patterns);

    spdlog::info(
        "policy_loader: rules loaded: jql fields={}, functions={}, patterns={}; "
        "graphql fields={}, queries={}, mutations={}, patterns={}",
        cfg.jql.allowed_fields.size(),
        cfg.jql.allowed_functions.size(),
        cfg.jql.dangerous_patterns.size(),
        cfg.graphql.allowed_fields.size(),
        cfg.graphql.allowed_queries.size(),
        cfg.graphql.allowed_mutations.size(),
        cfg.graphql.dangerous_patterns.size()
    );

    return cfg;
}
