#pragma once

#include <sstream>
#include <string>
#include <string_view>
#include <vector>

template<typename... Args>
inline std::string str(Args &&... args) {
    std::ostringstream oss;
    (oss << ... << args);
    return oss.str();
}

inline std::string_view str_trim(std::string_view s) {
    auto const spaces = " \t\r\n";
    auto first = s.find_first_not_of(spaces);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = s.find_last_not_of(spaces);
    return s.substr(first, last - first + 1);
}

inline std::vector<std::string_view> str_split(std::string_view s, char separator) {
    std::vector<std::string_view> ret;
    for (;;) {
        auto i = s.find(separator);
        ret.push_back(s.substr(0, i));
        if (i == std::string_view::npos) {
            return ret;
        }
        s.remove_prefix(i + 1);
    }
}
