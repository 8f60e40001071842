#pragma once

#include "str.hpp"

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

template<typename value_type>
struct escape_json_tag {
    value_type escape_value;
    template<typename constructor_type, std::enable_if_t<std::is_convertible<constructor_type, value_type>::value> * = nullptr>
    explicit escape_json_tag(constructor_type &&v) : escape_value(std::forward<constructor_type>(v)) {}
};

inline decltype(auto) escape_json(std::string_view value) {
    return escape_json_tag<std::string_view>(value);
}
inline decltype(auto) escape_json(std::string const &value) {
    return escape_json_tag<std::string_view>(value);
}
inline decltype(auto) escape_json(char const *value) {
    return escape_json_tag<std::string_view>(value);
}
inline decltype(auto) escape_json(bool b) {
    return escape_json_tag<bool>(b);
}
inline decltype(auto) escape_json(int32_t i) {
    return i;
}
inline decltype(auto) escape_json(uint32_t i) {
    return i;
}
inline decltype(auto) escape_json(uint64_t u) {
    return escape_json_tag<decltype(u)>(u);
}
inline decltype(auto) escape_json(int64_t i) {
    return escape_json_tag<decltype(i)>(i);
}
inline decltype(auto) escape_json(double d) {
    return escape_json_tag<double>(d);
}
// absent values are written as null
inline decltype(auto) escape_json(std::optional<double> d) {
    return escape_json_tag<std::optional<double>>(d);
}
inline decltype(auto) escape_json(std::optional<std::string> const &s) {
    return escape_json_tag<std::optional<std::string_view>>(s ? std::optional<std::string_view>(*s) : std::nullopt);
}

std::ostream &operator<<(std::ostream &os, escape_json_tag<std::string_view> s);
std::ostream &operator<<(std::ostream &os, escape_json_tag<double> s);
std::ostream &operator<<(std::ostream &os, escape_json_tag<bool> b);
std::ostream &operator<<(std::ostream &os, escape_json_tag<std::optional<double>> d);
std::ostream &operator<<(std::ostream &os, escape_json_tag<std::optional<std::string_view>> s);

template<typename int_type, std::enable_if_t<std::is_integral_v<int_type> && !std::is_same_v<int_type, bool>> * = nullptr>
inline std::ostream &operator<<(std::ostream &os, escape_json_tag<int_type> i) {
    auto val = i.escape_value;

    if (std::cmp_less_equal(val, (uint64_t(1) << 53) - 1) && std::cmp_greater_equal(val, -((int64_t(1) << 53) - 1))) {
        os << val;
    } else {
        os << '"' << val << '"';
    }
    return os;
}

// writes "key": for an object member, preceded by a comma unless first
inline std::ostream &escape_json_key(std::ostream &os, bool &first, std::string_view key) {
    if (!first) { os << ','; }
    first = false;
    return os << escape_json(key) << ':';
}
