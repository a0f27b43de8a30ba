#pragma once
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "types/cell.hpp"
#include "util/text.hpp"

namespace tabprof {

// Decimal or scientific notation; an exponent needs digits on both sides.
inline bool is_float64(std::string_view s) {
    if (s.empty()) return false;
    bool dot = false, exp = false, digit = false;
    std::size_t i = (s[0] == '+' || s[0] == '-') ? 1 : 0;
    for (; i < s.size(); ++i) {
        char c = s[i];
        if (std::isdigit(static_cast<unsigned char>(c))) { digit = true; continue; }
        if (c == '.' && !dot && !exp) { dot = true; continue; }
        if ((c == 'e' || c == 'E') && !exp && digit) {
            exp = true;
            digit = false;
            if (i + 1 < s.size() && (s[i + 1] == '+' || s[i + 1] == '-')) ++i;
            continue;
        }
        return false;
    }
    return digit;
}

// Numeric value of a present cell, or nullopt when it does not read as a finite number.
// Boolean cells are not numbers here; they are handled by the boolean rule.
inline std::optional<double> parse_number(const cell& c) {
    if (const auto* i = std::get_if<std::int64_t>(&c)) return static_cast<double>(*i);
    if (const auto* d = std::get_if<double>(&c)) {
        if (std::isfinite(*d)) return *d;
        return std::nullopt;
    }
    if (const auto* s = std::get_if<std::string>(&c)) {
        const std::string t = trim(*s);
        if (!is_float64(t)) return std::nullopt;
        char* end = nullptr;
        const double v = std::strtod(t.c_str(), &end);
        if (end != t.c_str() + t.size() || !std::isfinite(v)) return std::nullopt;
        return v;
    }
    return std::nullopt;
}

inline bool is_integral(double v) { return std::floor(v) == v; }

}
