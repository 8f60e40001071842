#include "escape_json.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>

std::ostream &operator<<(std::ostream &os, escape_json_tag<std::string_view> s) {
    os << '"';
    for (auto &&c : s.escape_value) {
        // https://www.json.org/json-en.html
        if (static_cast<unsigned char>(c) < 32 || c == 127) {
            switch (c) {
            case '\b': os << "\\b"; break;
            case '\f': os << "\\f"; break;
            case '\n': os << "\\n"; break;
            case '\r': os << "\\r"; break;
            case '\t': os << "\\t"; break;
            default: {
                auto flags = os.flags();
                auto fill = os.fill('0');
                os << "\\u" << std::setw(4) << std::right << std::hex << static_cast<int>(static_cast<unsigned char>(c));
                os.fill(fill);
                os.flags(flags);
            } break;
            }
        } else if (c == '\"' || c == '\\') {
            os << '\\' << c;
        } else {
            os << c;
        }
    }
    return os << '\"';
}

std::ostream &operator<<(std::ostream &os, escape_json_tag<double> s) {
    if (!std::isfinite(s.escape_value)) {
        return os << "null";
    }
    auto precision = os.precision(std::numeric_limits<double>::digits10 + 1);
    os << s.escape_value;
    os.precision(precision);
    return os;
}

std::ostream &operator<<(std::ostream &os, escape_json_tag<bool> b) {
    return os << (b.escape_value ? "true" : "false");
}

std::ostream &operator<<(std::ostream &os, escape_json_tag<std::optional<double>> d) {
    if (!d.escape_value) {
        return os << "null";
    }
    return os << escape_json(*d.escape_value);
}

std::ostream &operator<<(std::ostream &os, escape_json_tag<std::optional<std::string_view>> s) {
    if (!s.escape_value) {
        return os << "null";
    }
    return os << escape_json(*s.escape_value);
}
