#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace vnstage::strings {

inline std::string to_lower_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

inline std::string trim_copy(std::string_view value) {
    std::size_t start = 0;
    std::size_t end = value.size();

    while (start < end && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }

    return std::string(value.substr(start, end - start));
}

inline bool starts_with(std::string_view value, std::string_view prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

// "file:///a/b.png" -> "/a/b.png"; other strings are returned unchanged.
inline std::string strip_file_scheme(std::string_view url) {
    constexpr std::string_view scheme = "file://";
    if (starts_with(url, scheme)) {
        return std::string(url.substr(scheme.size()));
    }
    return std::string(url);
}

}
