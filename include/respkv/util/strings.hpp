#ifndef RESPKV_UTIL_STRINGS_HPP
#define RESPKV_UTIL_STRINGS_HPP

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

namespace respkv::util {

inline std::string to_upper(std::string_view str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

inline std::string to_lower(std::string_view str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

inline bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(a[i])) !=
            std::toupper(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

/*
    strict base-10 int64: optional '-', then digits only. no whitespace, no '+', no trailing
    bytes. returns false on overflow. std::stoll is too lenient for wire input ("12abc" -> 12)
*/
inline bool parse_int64(std::string_view sv, int64_t& out) {
    if (sv.empty()) {
        return false;
    }
    bool negative = false;
    std::size_t i = 0;
    if (sv[0] == '-') {
        negative = true;
        i = 1;
        if (i == sv.size()) {
            return false;
        }
    }

    // accumulate as a negative number so INT64_MIN fits
    int64_t value = 0;
    for (; i < sv.size(); ++i) {
        char c = sv[i];
        if (c < '0' || c > '9') {
            return false;
        }
        int digit = c - '0';
        if (value < (std::numeric_limits<int64_t>::min() + digit) / 10) {
            return false;
        }
        value = value * 10 - digit;
    }

    if (!negative) {
        if (value == std::numeric_limits<int64_t>::min()) {
            return false;
        }
        value = -value;
    }
    out = value;
    return true;
}

}  // namespace respkv::util

#endif
