#pragma once

// ---------------------------------------------------------------------------
// text.hpp
//
// 검증기들이 공유하는 ASCII 문자열 헬퍼.
// 모든 함수는 순수 함수이며 입력을 변경하지 않는다.
// 멀티바이트(UTF-8) 문자는 바이트 단위로 그대로 통과시킨다.
// ---------------------------------------------------------------------------

#include <string>
#include <string_view>

// 앞뒤 공백(스페이스, 탭, 개행 포함)을 제거한 view 를 반환한다.
[[nodiscard]] std::string_view trim(std::string_view s);

// ASCII 소문자 변환
[[nodiscard]] std::string to_lower(std::string_view s);

// 대소문자 무관 부분 문자열 포함 여부 (needle 은 소문자로 전달할 것)
[[nodiscard]] bool icontains(std::string_view haystack, std::string_view lower_needle);

// 로그/오류 메시지용으로 긴 문자열을 잘라낸다 (max_len 바이트 + "...")
[[nodiscard]] std::string truncate_for_log(std::string_view s, std::size_t max_len);
