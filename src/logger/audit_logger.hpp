#pragma once

// ---------------------------------------------------------------------------
// audit_logger.hpp
//
// spdlog 기반 구조화 JSON 감사 로거.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
// - 한 줄에 JSON 객체 하나. 키는 snake_case.
// - 쿼리 원문은 앞 128 바이트만 query_preview 로 기록한다. 경계에 걸친
//   UTF-8 문자는 잘라내지 않고 통째로 뺀다.
// ---------------------------------------------------------------------------

#include "logger/log_types.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}  // namespace spdlog

// ---------------------------------------------------------------------------
// AuditLogger
//   ValidationLog / RejectionLog 를 JSON 포맷으로 기록한다.
//   내부 진단용 debug/info/warn/error 메서드도 제공한다.
// ---------------------------------------------------------------------------
class AuditLogger {
public:
    static constexpr std::size_t kQueryPreviewBytes = 128;

    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 로그 파일 경로 (디렉터리가 아닌 파일 경로)
    //   console   : true 면 stderr 에도 같은 줄을 출력한다.
    //
    //   싱크 생성 실패 시 std::runtime_error.
    AuditLogger(LogLevel                     min_level,
                const std::filesystem::path& log_path,
                bool                         console = true);

    ~AuditLogger();

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    AuditLogger(const AuditLogger&)            = delete;
    AuditLogger& operator=(const AuditLogger&) = delete;

    AuditLogger(AuditLogger&&)            = default;
    AuditLogger& operator=(AuditLogger&&) = default;

    // log_accepted: info 레벨
    void log_accepted(const ValidationLog& entry);

    // log_rejected: warn 레벨
    void log_rejected(const RejectionLog& entry);

    // 내부 진단용 spdlog 래퍼
    //   쿼리 원문을 직접 전달하지 말 것.
    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

    // 버퍼된 로그를 싱크로 내보낸다
    void flush();

    [[nodiscard]] LogLevel min_level() const noexcept { return min_level_; }

private:
    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;
};

// JSON 문자열 이스케이프 (따옴표 제외한 본문만 반환)
[[nodiscard]] std::string escape_json_string(std::string_view str);
