// ---------------------------------------------------------------------------
// audit_logger.cpp
//
// spdlog 기반 구조화 JSON 감사 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/audit_logger.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include "common/text.hpp"

namespace {

// ---------------------------------------------------------------------------
// Helper: ISO8601 timestamp 포맷
// ---------------------------------------------------------------------------
std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto duration = tp.time_since_epoch();
    const auto seconds  = std::chrono::duration_cast<std::chrono::seconds>(duration);
    const auto millis   = std::chrono::duration_cast<std::chrono::milliseconds>(duration) - seconds;

    const std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm           tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count() << 'Z';
    return oss.str();
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

// 앞 kQueryPreviewBytes 바이트. 경계에 걸친 UTF-8 다중 바이트 문자는 통째로 뺀다.
std::string preview(const std::string& query) {
    std::size_t cut = std::min(query.size(), AuditLogger::kQueryPreviewBytes);
    if (cut < query.size()) {
        // query[cut] 이 연속 바이트(10xxxxxx)면 문자 중간이므로 시작 바이트까지 물러난다
        while (cut > 0 && (static_cast<unsigned char>(query[cut]) & 0xC0U) == 0x80U) {
            --cut;
        }
    }
    return escape_json_string(std::string_view(query).substr(0, cut));
}

}  // namespace

// ---------------------------------------------------------------------------
// JSON 문자열 이스케이프
// ---------------------------------------------------------------------------
std::string escape_json_string(std::string_view str) {
    std::string result;
    result.reserve(str.size() + 16);

    for (const char c : str) {
        const auto ch = static_cast<unsigned char>(c);
        switch (ch) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b";  break;
            case '\f': result += "\\f";  break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            default:
                if (ch < 0x20) {
                    char buf[8]{};
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
                    result += buf;
                } else {
                    result += c;
                }
                break;
        }
    }

    return result;
}

std::optional<LogLevel> parse_log_level(std::string_view text) {
    const std::string lower = to_lower(trim(text));
    if (lower == "debug" || lower == "trace") {
        return LogLevel::kDebug;
    }
    if (lower == "info") {
        return LogLevel::kInfo;
    }
    if (lower == "warn" || lower == "warning") {
        return LogLevel::kWarn;
    }
    if (lower == "error" || lower == "critical") {
        return LogLevel::kError;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// AuditLogger 생성자
// ---------------------------------------------------------------------------
AuditLogger::AuditLogger(LogLevel min_level, const std::filesystem::path& log_path, bool console)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }

        std::vector<spdlog::sink_ptr> sinks;

        if (console) {
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());
        }

        // Rotating file sink (100MB, 3개 파일 유지)
        const std::size_t max_file_size = 100 * 1024 * 1024;
        const std::size_t max_files     = 3;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path_.string(), max_file_size, max_files));

        // 전역 레지스트리에 등록하지 않는다 (인스턴스별 소유)
        logger_ = std::make_shared<spdlog::logger>("querywall", sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(min_level));

        // 각 줄은 JSON 객체 그대로 (타임스탬프는 JSON 안에 포함)
        logger_->set_pattern("%v");
        logger_->flush_on(spdlog::level::trace);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

AuditLogger::~AuditLogger() {
    if (logger_) {
        logger_->flush();
    }
}

// ---------------------------------------------------------------------------
// log_accepted: JSON 직렬화
// ---------------------------------------------------------------------------
void AuditLogger::log_accepted(const ValidationLog& entry) {
    if (!logger_ || min_level_ > LogLevel::kInfo) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"query_accepted","language":")" << to_string(entry.language)
         << R"(","operation":")" << escape_json_string(entry.operation)
         << R"(","query_length":)" << entry.query.size()
         << R"(,"query_preview":")" << preview(entry.query)
         << R"(","timestamp":")" << format_iso8601(entry.timestamp)
         << R"(","duration_us":)" << entry.duration.count() << R"(})";

    logger_->info(json.str());
}

// ---------------------------------------------------------------------------
// log_rejected: JSON 직렬화
// ---------------------------------------------------------------------------
void AuditLogger::log_rejected(const RejectionLog& entry) {
    if (!logger_ || min_level_ > LogLevel::kWarn) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"query_rejected","language":")" << to_string(entry.language)
         << R"(","error_code":")" << to_string(entry.code)
         << R"(","reason":")" << escape_json_string(entry.reason)
         << R"(","context":")" << escape_json_string(entry.context)
         << R"(","query_length":)" << entry.query.size()
         << R"(,"query_preview":")" << preview(entry.query)
         << R"(","timestamp":")" << format_iso8601(entry.timestamp) << R"("})";

    logger_->warn(json.str());
}

// ---------------------------------------------------------------------------
// 내부 진단용 spdlog 래퍼
// ---------------------------------------------------------------------------
void AuditLogger::debug(std::string_view msg) {
    if (logger_) {
        logger_->debug(msg);
    }
}

void AuditLogger::info(std::string_view msg) {
    if (logger_) {
        logger_->info(msg);
    }
}

void AuditLogger::warn(std::string_view msg) {
    if (logger_) {
        logger_->warn(msg);
    }
}

void AuditLogger::error(std::string_view msg) {
    if (logger_) {
        logger_->error(msg);
    }
}

void AuditLogger::flush() {
    if (logger_) {
        logger_->flush();
    }
}
