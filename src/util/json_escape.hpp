// src/util/json_escape.hpp
#pragma once
#include <cmath>
#include <cstddef>
#include <string>
#include <string_view>
#include <fmt/format.h>

#include "util/text.hpp"

namespace tabprof {

// JSON string body for `in`: quote, backslash and control characters escaped,
// well-formed UTF-8 passed through, malformed bytes replaced by U+FFFD.
inline std::string json_escape(std::string_view in) {
    std::string out;
    out.reserve(in.size() + 16);
    for (std::size_t i = 0; i < in.size();) {
        const std::size_t n = utf8_sequence_length(in, i);
        if (n == 0) { out += utf8_replacement; ++i; continue; }
        if (n > 1)  { out.append(in.data() + i, n); i += n; continue; }

        const unsigned char c = static_cast<unsigned char>(in[i++]);
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (c < 0x20) out += fmt::format("\\u{:04x}", c);
                else out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

inline std::string json_quote(std::string_view in) {
    return fmt::format("\"{}\"", json_escape(in));
}

// Shortest round-trip form that still reads back as a JSON float ("2" -> "2.0").
// Non-finite values have no JSON spelling and are written as null.
inline std::string json_number(double v) {
    if (!std::isfinite(v)) return "null";
    std::string s = fmt::format("{}", v);
    if (s.find_first_of(".eE") == std::string::npos) s += ".0";
    return s;
}

}
