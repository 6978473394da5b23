#pragma once

#include "ResampleTypes.h"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace CommonUtils {

inline std::string trim(std::string_view s) {
    const size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    const size_t e = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(b, e - b + 1));
}

inline std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

inline bool isMissingToken(std::string_view raw) {
    const std::string s = toLower(trim(raw));
    return s.empty() || s == "na" || s == "n/a" || s == "null" || s == "none" || s == "nan" || s == "missing";
}

// "{0: 90, 1: 10}" in class id order.
inline std::string formatClassCounts(const ClassCounts& counts) {
    std::ostringstream out;
    out << "{";
    bool first = true;
    for (const auto& kv : counts) {
        if (!first) out << ", ";
        out << kv.first << ": " << kv.second;
        first = false;
    }
    out << "}";
    return out.str();
}

} // namespace CommonUtils
