// ---------------------------------------------------------------------------
// types.cpp
//
// 공용 열거형의 문자열 변환.
// 반환값은 감사 로그의 "error_code" / "language" 필드와 CLI 출력에 그대로
// 쓰이므로, 이름을 바꾸면 로그 소비자(대시보드, 알림 규칙)도 함께 바꿔야 한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

std::string_view to_string(ValidationErrorCode code) noexcept {
    switch (code) {
        case ValidationErrorCode::kEmptyInput:              return "EmptyInput";
        case ValidationErrorCode::kTooLong:                 return "TooLong";
        case ValidationErrorCode::kDangerousPattern:        return "DangerousPattern";
        case ValidationErrorCode::kUnbalancedQuotes:        return "UnbalancedQuotes";
        case ValidationErrorCode::kUnbalancedDelimiters:    return "UnbalancedDelimiters";
        case ValidationErrorCode::kNestingTooDeep:          return "NestingTooDeep";
        case ValidationErrorCode::kUnknownField:            return "UnknownField";
        case ValidationErrorCode::kUnknownFunction:         return "UnknownFunction";
        case ValidationErrorCode::kUnknownOperation:        return "UnknownOperation";
        case ValidationErrorCode::kUnsupportedOperation:    return "UnsupportedOperation";
        case ValidationErrorCode::kSqlKeywordNotAllowed:    return "SqlKeywordNotAllowed";
        case ValidationErrorCode::kInvalidVariableName:     return "InvalidVariableName";
        case ValidationErrorCode::kTooManyVariables:        return "TooManyVariables";
        case ValidationErrorCode::kVariableTooLarge:        return "VariableTooLarge";
        case ValidationErrorCode::kUnsupportedVariableType: return "UnsupportedVariableType";
    }
    return "Unknown";
}

std::string_view to_string(QueryLanguage language) noexcept {
    switch (language) {
        case QueryLanguage::kJql:     return "jql";
        case QueryLanguage::kGraphql: return "graphql";
    }
    return "unknown";
}
