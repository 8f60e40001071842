#pragma once
#include "str.hpp"

#include <chrono>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

inline double now_unixtime() { return std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::system_clock::now().time_since_epoch()).count() / 1e9; }

inline std::tm local_tm(double unixtime) {
    std::time_t rounded_time = static_cast<std::time_t>(std::floor(unixtime));
    std::tm ti;
    if (!localtime_r(&rounded_time, &ti)) { throw std::runtime_error(str("local_tm localtime_r failed: ", unixtime)); }
    return ti;
}

inline std::string strftime_local(double unixtime, char const *format) {
    auto ti = local_tm(unixtime);
    char buffer[64];
    auto len = strftime(buffer, sizeof(buffer), format, &ti);
    if (!len) { throw std::runtime_error(str("strftime_local failed: ", format, " ", unixtime)); }
    return std::string(buffer, len);
}

// 2026-10-19T14:15:00.123456 in local time
inline std::string iso8601_local(double unixtime) {
    auto seconds = std::floor(unixtime);
    auto micros = std::llround((unixtime - seconds) * 1e6);
    if (micros >= 1000000) {
        seconds += 1;
        micros -= 1000000;
    }
    char fraction[8];
    std::snprintf(fraction, sizeof(fraction), ".%06lld", micros);
    return strftime_local(seconds, "%Y-%m-%dT%H:%M:%S") + fraction;
}

inline std::optional<double> unixtime_from_iso8601_local(std::string_view iso) {
    std::tm ti{};
    int consumed = 0;
    auto s = std::string{iso};
    if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &ti.tm_year, &ti.tm_mon, &ti.tm_mday, &ti.tm_hour, &ti.tm_min, &ti.tm_sec, &consumed) != 6) {
        return std::nullopt;
    }
    double fraction = 0;
    if (consumed < (int) s.size()) {
        if (s[consumed] != '.') { return std::nullopt; }
        char *end = nullptr;
        fraction = std::strtod(s.c_str() + consumed, &end);
        if (end != s.c_str() + s.size()) { return std::nullopt; }
    }
    ti.tm_year -= 1900;
    ti.tm_mon -= 1;
    ti.tm_isdst = -1;
    auto t = std::mktime(&ti);
    if (t == static_cast<std::time_t>(-1)) { return std::nullopt; }
    return static_cast<double>(t) + fraction;
}
