// src/types/cell.hpp
#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <fmt/format.h>

namespace tabprof {

// One raw value as handed over by a reader. std::monostate is the absent marker;
// readers may also hand over NaN or empty strings, see is_absent().
using cell = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

inline const char* bool_text(bool b) { return b ? "True" : "False"; }

// Textual representation used for distinct counts, frequency tables and lengths.
inline std::string cell_text(const cell& c) {
    struct visitor {
        std::string operator()(std::monostate) const { return {}; }
        std::string operator()(bool b) const { return bool_text(b); }
        std::string operator()(std::int64_t v) const { return fmt::format("{}", v); }
        std::string operator()(double v) const { return fmt::format("{}", v); }
        std::string operator()(const std::string& s) const { return s; }
    };
    return std::visit(visitor{}, c);
}

}
