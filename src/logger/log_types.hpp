#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 감사 로그 엔트리 타입 정의.
//
// [민감정보 취급 주의]
// - query 는 원문 전체를 담지만, 로거는 앞 128 바이트(query_preview)만
//   기록한다. 쿼리 값에 개인정보가 들어갈 수 있기 때문이다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"  // QueryLanguage, ValidationErrorCode

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. 환경 변수 / 규칙 파일에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// "debug" | "info" | "warn" | "error" (대소문자 무관). 그 외는 nullopt.
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text);

// ---------------------------------------------------------------------------
// ValidationLog
//   검증 통과 이벤트 ("query_accepted").
//   operation: GraphQL 오퍼레이션 타입/이름 ("query getTests"). JQL 은 빈 문자열.
// ---------------------------------------------------------------------------
struct ValidationLog {
    QueryLanguage                              language{QueryLanguage::kJql};
    std::string                                operation{};
    std::string                                query{};        // 원문 (preview 로만 기록)
    std::chrono::system_clock::time_point      timestamp{};
    std::chrono::microseconds                  duration{0};    // 검증 소요 시간
};

// ---------------------------------------------------------------------------
// RejectionLog
//   검증 거부 이벤트 ("query_rejected").
//   reason: 사람이 읽을 수 있는 거부 사유
//   context: 거부를 유발한 토큰/패턴/변수 경로
// ---------------------------------------------------------------------------
struct RejectionLog {
    QueryLanguage                              language{QueryLanguage::kJql};
    ValidationErrorCode                        code{ValidationErrorCode::kEmptyInput};
    std::string                                reason{};
    std::string                                context{};
    std::string                                query{};        // 원문 (preview 로만 기록)
    std::chrono::system_clock::time_point      timestamp{};
};
