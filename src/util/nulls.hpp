#pragma once
#include <cmath>
#include <string_view>
#include <string>
#include <vector>

#include "types/cell.hpp"
#include "util/text.hpp"

namespace tabprof {

inline const std::vector<std::string>& default_null_tokens() {
    static const std::vector<std::string> k{"", "NA", "N/A", "null", "NULL", "NaN", "None"};
    return k;
}

inline bool is_null_like(std::string_view s, const std::vector<std::string>& nulls) {
    const std::string_view t = trim_view(s);
    for (const auto& n : nulls) {
        if (t == n) return true;
    }
    return false;
}

// Absent = null marker, NaN or infinity, or a string with no non-blank characters.
inline bool is_absent(const cell& c) {
    if (std::holds_alternative<std::monostate>(c)) return true;
    if (const auto* d = std::get_if<double>(&c)) return !std::isfinite(*d);
    if (const auto* s = std::get_if<std::string>(&c)) return trim_view(*s).empty();
    return false;
}

}
