#pragma once

#include <cstdlib>
#include <sstream>
#include <string>

// the whole of the given text must parse, otherwise the default is kept
template<typename T>
inline T env_convert_default(T &&default_value, char const *given) {
    T ret;
    auto is = std::istringstream{given};
    is >> ret;
    if (is.fail()) {
        return default_value;
    }
    is >> std::ws;
    if (!is.eof()) {
        return default_value;
    }
    return ret;
}

template<>
inline std::string env_convert_default(std::string &&default_value, char const *given) {
    return given;
}

template<>
inline bool env_convert_default(bool &&default_value, char const *given) {
    auto s = std::string{given};
    if (s == "1" || s == "true" || s == "yes" || s == "on") {
        return true;
    }
    if (s == "0" || s == "false" || s == "no" || s == "off") {
        return false;
    }
    return default_value;
}

template<typename T>
inline T env(char const *var, T default_value) {
    auto given = std::getenv(var);
    if (!given || !*given) {
        return default_value;
    }
    return env_convert_default(std::move(default_value), given);
}

inline std::string env(char const *var, char const *default_value) {
    return env(var, std::string(default_value));
}

template<typename T>
inline T env_at_least(char const *var, T default_value, T minimum) {
    auto ret = env(var, default_value);
    return ret < minimum ? minimum : ret;
}
