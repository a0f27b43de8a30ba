#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "types/cell.hpp"
#include "util/text.hpp"

namespace tabprof {

// Lower-cased truth literal of a present cell, or nullopt when it is not one of
// true/false, yes/no, 1/0, t/f, y/n, on/off.
inline std::optional<std::string> bool_literal(const cell& c) {
    if (const auto* b = std::get_if<bool>(&c)) return std::string(*b ? "true" : "false");
    if (const auto* i = std::get_if<std::int64_t>(&c)) {
        if (*i == 0 || *i == 1) return std::string(*i ? "1" : "0");
        return std::nullopt;
    }
    if (const auto* d = std::get_if<double>(&c)) {
        if (*d == 0.0 || *d == 1.0) return std::string(*d != 0.0 ? "1" : "0");
        return std::nullopt;
    }
    if (const auto* s = std::get_if<std::string>(&c)) {
        const std::string t = to_lower(trim_view(*s));
        static const char* k[] = {"true","false","yes","no","1","0","t","f","y","n","on","off"};
        for (auto* w : k) if (t == w) return t;
    }
    return std::nullopt;
}

inline std::optional<bool> parse_bool(const cell& c) {
    const auto lit = bool_literal(c);
    if (!lit) return std::nullopt;
    const std::string& t = *lit;
    return t == "true" || t == "yes" || t == "1" || t == "t" || t == "y" || t == "on";
}

}
