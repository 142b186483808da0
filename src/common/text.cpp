// ---------------------------------------------------------------------------
// text.cpp
// ---------------------------------------------------------------------------

#include "common/text.hpp"

#include <algorithm>
#include <cctype>

std::string_view trim(std::string_view s) {
    const auto not_space = [](unsigned char c) { return std::isspace(c) == 0; };
    const auto begin = std::find_if(s.begin(), s.end(), not_space);
    if (begin == s.end()) {
        return {};
    }
    const auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
    return s.substr(
        static_cast<std::size_t>(begin - s.begin()),
        static_cast<std::size_t>(end - begin)
    );
}

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool icontains(std::string_view haystack, std::string_view lower_needle) {
    if (lower_needle.empty()) {
        return true;
    }
    return to_lower(haystack).find(lower_needle) != std::string::npos;
}

std::string truncate_for_log(std::string_view s, std::size_t max_len) {
    if (s.size() <= max_len) {
        return std::string(s);
    }
    return std::string(s.substr(0, max_len)) + "...";
}
