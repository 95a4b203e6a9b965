#pragma once

#include <string_view>

namespace tsbase::text {

// Baseline formats indent with spaces only; tabs are content.
inline std::string_view trim_space_start(std::string_view s) {
    std::size_t i = 0;
    while (i < s.size() && s[i] == ' ') ++i;
    return s.substr(i);
}

inline std::string_view trim_space_end(std::string_view s) {
    std::size_t n = s.size();
    while (n > 0 && s[n - 1] == ' ') --n;
    return s.substr(0, n);
}

inline std::string_view trim_space(std::string_view s) {
    return trim_space_end(trim_space_start(s));
}

inline bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace tsbase::text
