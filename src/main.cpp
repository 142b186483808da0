#include "logger/audit_logger.hpp"
#include "policy/policy_loader.hpp"
#include "validator/graphql_validator.hpp"
#include "validator/jql_validator.hpp"
#include "validator/variable_value.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

// ---------------------------------------------------------------------------
// querywall CLI
//
//   querywall jql <query>
//   querywall graphql <document-file|-> [variables-file] [expected-operation]
//   querywall escape-jql <value>
//   querywall escape-graphql <value>
//
// 종료 코드: 0 통과(정제된 쿼리를 stdout 에 출력), 1 거부/오류
// ("<ErrorCode>: <message>" 를 stderr 에 출력), 2 사용법 오류.
// ---------------------------------------------------------------------------
namespace {

constexpr int kExitRejected = 1;
constexpr int kExitUsage    = 2;

std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
    }
    return spdlog::level::info;
}

int usage() {
    std::cerr << "usage:\n"
                 "  querywall jql <query>\n"
                 "  querywall graphql <document-file|-> [variables-file] [expected-operation]\n"
                 "  querywall escape-jql <value>\n"
                 "  querywall escape-graphql <value>\n";
    return kExitUsage;
}

std::optional<std::string> read_input(const std::string& path) {
    if (path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

// ---------------------------------------------------------------------------
// 판정 결과를 감사 로그에 남기고 CLI 출력/종료 코드로 변환
// ---------------------------------------------------------------------------
class Runner {
public:
    Runner(const FirewallConfig& config, AuditLogger& audit)
        : jql_(std::make_shared<const JqlRules>(config.jql))
        , graphql_(std::make_shared<const GraphqlRules>(config.graphql))
        , audit_(audit)
    {}

    int run_jql(const std::string& query) {
        const auto started = std::chrono::steady_clock::now();
        auto result = jql_.validate_and_sanitize(query);
        if (!result) {
            return reject(QueryLanguage::kJql, result.error(), query);
        }
        accept(QueryLanguage::kJql, "", query, started);
        std::cout << *result << '\n';
        return EXIT_SUCCESS;
    }

    int run_graphql(const std::string&                document,
                    const std::optional<VariableMap>& variables,
                    const std::optional<std::string>& expected_operation) {
        const auto started = std::chrono::steady_clock::now();
        auto result = expected_operation
            ? graphql_.validate_for_operation(document, *expected_operation, variables)
            : graphql_.validate_query(document, variables);
        if (!result) {
            return reject(QueryLanguage::kGraphql, result.error(), document);
        }

        std::string operation;
        if (auto header = graphql_.parse_operation_header(*result)) {
            operation = std::string(to_string(header->type));
            if (!header->name.empty()) {
                operation += " " + header->name;
            }
        }
        accept(QueryLanguage::kGraphql, operation, document, started);
        std::cout << *result << '\n';
        return EXIT_SUCCESS;
    }

    int reject(QueryLanguage language, const ValidationError& err, const std::string& query) {
        RejectionLog entry{};
        entry.language  = language;
        entry.code      = err.code;
        entry.reason    = err.message;
        entry.context   = err.context;
        entry.query     = query;
        entry.timestamp = std::chrono::system_clock::now();
        audit_.log_rejected(entry);

        std::cerr << to_string(err.code) << ": " << err.message << '\n';
        return kExitRejected;
    }

private:
    void accept(QueryLanguage                                language,
                std::string                                  operation,
                const std::string&                           query,
                std::chrono::steady_clock::time_point        started) {
        ValidationLog entry{};
        entry.language  = language;
        entry.operation = std::move(operation);
        entry.query     = query;
        entry.timestamp = std::chrono::system_clock::now();
        entry.duration  = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - started);
        audit_.log_accepted(entry);
    }

    JqlValidator     jql_;
    GraphqlValidator graphql_;
    AuditLogger&     audit_;
};

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    if (argc < 3) {
        return usage();
    }
    const std::string_view command = argv[1];

    // ── 순수 변환 명령 (설정/로그 불필요) ──────────────────────────────
    if (command == "escape-jql") {
        std::cout << JqlValidator::escape_string_value(argv[2]) << '\n';
        return EXIT_SUCCESS;
    }
    if (command == "escape-graphql") {
        std::cout << GraphqlValidator::escape_string_value(argv[2]) << '\n';
        return EXIT_SUCCESS;
    }
    if (command != "jql" && command != "graphql") {
        return usage();
    }

    // ── 진단 로그는 stderr 로 (stdout 은 정제된 쿼리 전용) ───────────────
    spdlog::set_default_logger(spdlog::stderr_color_mt("querywall-diag"));

    // ── 설정 로드 (환경변수 우선, 규칙 파일, 내장 기본값 순) ─────────────
    FirewallConfig config = default_firewall_config();
    const std::string rules_path = env_str("QUERYWALL_RULES_PATH", "");
    if (!rules_path.empty()) {
        auto loaded = PolicyLoader::load(rules_path);
        if (!loaded) {
            std::cerr << "config error: " << loaded.error() << '\n';
            return kExitRejected;
        }
        config = std::move(*loaded);
    }

    const std::string level_name = env_str("QUERYWALL_LOG_LEVEL", config.global.log_level);
    const std::string audit_path = env_str("QUERYWALL_AUDIT_LOG", config.global.audit_log_path);

    LogLevel level = LogLevel::kInfo;
    if (auto parsed = parse_log_level(level_name)) {
        level = *parsed;
    } else {
        spdlog::warn("log level '{}' is invalid, using info", level_name);
    }
    spdlog::set_level(to_spdlog_level(level));

    std::unique_ptr<AuditLogger> audit;
    try {
        audit = std::make_unique<AuditLogger>(level, audit_path, /*console=*/false);
    } catch (const std::runtime_error& e) {
        std::cerr << "audit log error: " << e.what() << '\n';
        return kExitRejected;
    }

    Runner runner{config, *audit};

    if (command == "jql") {
        if (argc != 3) {
            return usage();
        }
        return runner.run_jql(argv[2]);
    }

    // graphql <document-file|-> [variables-file] [expected-operation]
    if (argc > 5) {
        return usage();
    }
    auto document = read_input(argv[2]);
    if (!document) {
        std::cerr << "cannot read document '" << argv[2] << "'\n";
        return kExitUsage;
    }

    std::optional<VariableMap> variables;
    if (argc >= 4 && argv[3][0] != '\0') {
        auto text = read_input(argv[3]);
        if (!text) {
            std::cerr << "cannot read variables '" << argv[3] << "'\n";
            return kExitUsage;
        }
        auto converted = variables_from_string(*text);
        if (!converted) {
            return runner.reject(QueryLanguage::kGraphql, converted.error(), *document);
        }
        variables = std::move(*converted);
    }

    std::optional<std::string> expected_operation;
    if (argc == 5) {
        expected_operation = argv[4];
    }

    return runner.run_graphql(*document, variables, expected_operation);
}
