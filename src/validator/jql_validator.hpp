#pragma once

// ---------------------------------------------------------------------------
// jql_validator.hpp
//
// 화이트리스트 기반 JQL 인젝션 방화벽.
// 원격 API 로 보내기 전에 JQL 문자열을 검사하여, 안전하면 앞뒤 공백만 제거한
// 원문을 그대로 돌려주고, 아니면 첫 번째 위반을 ValidationError 로 반환한다.
// 쿼리 내용을 고쳐 쓰는 일은 절대 없다 (accept-unchanged-or-reject).
//
// [파이프라인 — 고정 순서, 첫 위반에서 즉시 반환]
// 1. 빈 입력(kEmptyInput), 길이 상한 초과(kTooLong)
// 2. 위험 패턴 스캔, 원문 대상 (kDangerousPattern)
// 3. 구조 검사: 따옴표 → 괄호 균형 → 깊이 ≤ 3
// 4. 필드 추출 + 화이트리스트 (kUnknownField)
// 5. 함수 추출 + 화이트리스트 (kUnknownFunction)
// 6. SQL 키워드 가드 (kSqlKeywordNotAllowed)
// 7. trim 된 원문 반환
//
// 앞 단계가 뒤 단계를 불필요하게 만드는 것처럼 보여도 어떤 단계도
// 건너뛰지 않는다. 각 단계는 서로 다른 공격 유형을 막는다.
//
// [설계 한계]
// - 문법 전체를 파싱하지 않는 휴리스틱 화이트리스트다. 값 자리의 따옴표 없는
//   식별자(status = Open)는 필드로 보지 않으므로 화이트리스트 검사 대상이
//   아니다.
// ---------------------------------------------------------------------------

#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"
#include "parser/jql_lexer.hpp"
#include "parser/pattern_matcher.hpp"
#include "parser/structural_validator.hpp"
#include "policy/rule.hpp"

class JqlValidator {
public:
    // 내장 기본 테이블로 생성
    JqlValidator();

    // rules 가 nullptr 이면 내장 기본 테이블을 사용한다.
    explicit JqlValidator(std::shared_ptr<const JqlRules> rules);

    ~JqlValidator() = default;

    // 복사 금지 (PatternMatcher), 이동 금지 (lexer_ 가 rules_ 내부를 가리킴)
    JqlValidator(const JqlValidator&)            = delete;
    JqlValidator& operator=(const JqlValidator&) = delete;
    JqlValidator(JqlValidator&&)                 = delete;
    JqlValidator& operator=(JqlValidator&&)      = delete;

    // validate_and_sanitize
    //   성공: 앞뒤 공백만 제거된 원문 (내부 문자는 바이트 단위로 동일)
    //   실패: 첫 번째 위반의 ValidationError
    //
    //   [스레드 안전성] const, 공유 테이블 읽기 전용. 동시 호출 안전.
    [[nodiscard]] std::expected<std::string, ValidationError>
    validate_and_sanitize(std::string_view jql) const;

    // escape_string_value
    //   사용자 입력 리터럴을 JQL 문자열 토큰 안에 넣기 위한 변환.
    //   '\' → '\\', '"' → '\"', 0x20 미만 제어 문자 제거.
    //   검증 파이프라인과 무관한 순수 함수.
    [[nodiscard]] static std::string escape_string_value(std::string_view value);

    [[nodiscard]] const JqlRules& rules() const noexcept { return *rules_; }

private:
    using StageResult = std::expected<void, ValidationError>;

    [[nodiscard]] StageResult check_input_bounds(std::string_view jql) const;
    [[nodiscard]] StageResult check_dangerous_patterns(std::string_view jql) const;
    [[nodiscard]] StageResult check_fields(const std::vector<JqlToken>& tokens) const;
    [[nodiscard]] StageResult check_functions(const std::vector<JqlToken>& tokens) const;
    [[nodiscard]] StageResult check_sql_keywords(const std::vector<JqlToken>& tokens) const;

    [[nodiscard]] bool is_allowed_field(const std::string& name) const;
    [[nodiscard]] bool is_valid_custom_field(std::string_view token) const;

    std::shared_ptr<const JqlRules> rules_;
    PatternMatcher                  dangerous_;
    StructuralValidator             structural_;
    JqlLexer                        lexer_;
};

// 프로세스 전역 기본 인스턴스로 검증하는 편의 함수
[[nodiscard]] std::expected<std::string, ValidationError> validate_jql(std::string_view jql);
