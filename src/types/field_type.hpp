#pragma once
#include <optional>
#include <string_view>

namespace tabprof {

enum class field_type { integer_, float_, boolean_, datetime_, categorical_, identifier_, string_ };

inline const char* to_string(field_type t) {
    switch (t) {
        case field_type::integer_:     return "integer";
        case field_type::float_:       return "float";
        case field_type::boolean_:     return "boolean";
        case field_type::datetime_:    return "datetime";
        case field_type::categorical_: return "categorical";
        case field_type::identifier_:  return "identifier";
        default:                       return "string";
    }
}

inline std::optional<field_type> parse_field_type(std::string_view s) {
    if (s == "integer")     return field_type::integer_;
    if (s == "float")       return field_type::float_;
    if (s == "boolean")     return field_type::boolean_;
    if (s == "datetime")    return field_type::datetime_;
    if (s == "categorical") return field_type::categorical_;
    if (s == "identifier")  return field_type::identifier_;
    if (s == "string")      return field_type::string_;
    return std::nullopt;
}

// Boolean and identifier columns are profiled with the categorical statistics block.
inline bool uses_categorical_stats(field_type t) {
    return t == field_type::categorical_ || t == field_type::boolean_ || t == field_type::identifier_;
}

inline bool is_numeric(field_type t) {
    return t == field_type::integer_ || t == field_type::float_;
}

}
