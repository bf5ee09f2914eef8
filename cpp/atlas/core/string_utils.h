#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace atlas {

inline char asciiLower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

// True when the string holds nothing but ASCII whitespace.
inline bool isBlank(std::string_view s) {
    return std::all_of(s.begin(), s.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    });
}

// Case-insensitive substring match (ASCII folding). An empty needle matches everything.
inline bool containsIgnoreCase(std::string_view haystack, std::string_view needle) {
    if (needle.empty()) return true;
    if (needle.size() > haystack.size()) return false;
    const auto it = std::search(
        haystack.begin(), haystack.end(),
        needle.begin(), needle.end(),
        [](char a, char b) { return asciiLower(a) == asciiLower(b); });
    return it != haystack.end();
}

} // namespace atlas
