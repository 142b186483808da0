#pragma once

#include <cstdint>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// QueryLanguage
//   검증 대상 쿼리 언어. 감사 로그와 CLI 에서 언어 구분에 사용한다.
// ---------------------------------------------------------------------------
enum class QueryLanguage : std::uint8_t {
    kJql     = 0,
    kGraphql = 1,
};

// ---------------------------------------------------------------------------
// ValidationErrorCode
//   검증 단계에서 발생 가능한 거부 사유 분류.
//   호출자(도구 레이어)는 code 로 분기하고, message 는 사용자 응답에 사용한다.
// ---------------------------------------------------------------------------
enum class ValidationErrorCode : std::uint8_t {
    kEmptyInput              = 0,   // 빈 문자열 또는 공백 전용 입력
    kTooLong                 = 1,   // 길이 상한 초과
    kDangerousPattern        = 2,   // 위험 패턴(정규식) 매칭
    kUnbalancedQuotes        = 3,   // 따옴표 짝 불일치
    kUnbalancedDelimiters    = 4,   // 괄호/중괄호 짝 불일치
    kNestingTooDeep          = 5,   // 중첩 깊이 상한 초과
    kUnknownField            = 6,   // 화이트리스트에 없는 필드
    kUnknownFunction         = 7,   // 화이트리스트에 없는 함수
    kUnknownOperation        = 8,   // 인식 불가/허용되지 않은 GraphQL 오퍼레이션
    kUnsupportedOperation    = 9,   // subscription, 다중 오퍼레이션
    kSqlKeywordNotAllowed    = 10,  // JQL 내 SQL 키워드
    kInvalidVariableName     = 11,  // GraphQL 변수명 형식 오류
    kTooManyVariables        = 12,  // GraphQL 변수 개수 초과
    kVariableTooLarge        = 13,  // 변수 문자열/배열/객체/중첩 크기 초과
    kUnsupportedVariableType = 14,  // 변환 불가능한 변수 값 타입
};

// ---------------------------------------------------------------------------
// ValidationError
//   검증 실패 시 반환되는 오류 정보.
//   std::expected<T, ValidationError> 패턴과 함께 사용한다.
//
//   [보안 주의]
//   context 에는 거부를 유발한 토큰/패턴/변수 경로만 담는다.
//   쿼리 원문 전체를 담지 않는다 (감사 로그 크기 및 민감정보 노출 방지).
// ---------------------------------------------------------------------------
struct ValidationError {
    ValidationErrorCode code{ValidationErrorCode::kEmptyInput};
    std::string         message{};  // 사람이 읽을 수 있는 오류 설명
    std::string         context{};  // 거부를 유발한 토큰/패턴 (로깅용)
};

// ValidationErrorCode → 안정적인 기계 판독용 이름 ("UnknownField" 등)
[[nodiscard]] std::string_view to_string(ValidationErrorCode code) noexcept;

// QueryLanguage → "jql" | "graphql"
[[nodiscard]] std::string_view to_string(QueryLanguage language) noexcept;
