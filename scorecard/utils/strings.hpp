#ifndef SCORECARD_UTILS_STRINGS_HPP
#define SCORECARD_UTILS_STRINGS_HPP

#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace scorecard::utils {

// ASCII lowercase copy; used for case-insensitive file name comparisons
inline std::string to_lower(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

inline std::string join(const std::vector<std::string>& parts, std::string_view separator) {
    std::string joined;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i) {
            joined += separator;
        }
        joined += parts[i];
    }
    return joined;
}

} // namespace scorecard::utils

#endif // SCORECARD_UTILS_STRINGS_HPP
