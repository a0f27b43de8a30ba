#pragma once
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_set>
#include <variant>
#include <vector>

#include "profile/profile_config.hpp"
#include "types/cell.hpp"
#include "types/field_type.hpp"
#include "types/parse_bool.hpp"
#include "types/parse_date.hpp"
#include "types/parse_number.hpp"
#include "util/nulls.hpp"
#include "util/text.hpp"

namespace tabprof {

// 8-4-4-4-12 hex grouping, case-insensitive.
inline bool is_uuid(std::string_view s) {
    s = trim_view(s);
    if (s.size() != 36) return false;
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (s[i] != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(s[i]))) {
            return false;
        }
    }
    return true;
}

inline bool is_uuid(const cell& c) {
    const auto* s = std::get_if<std::string>(&c);
    return s && is_uuid(std::string_view(*s));
}

inline bool name_looks_like_id(std::string_view name, const std::vector<std::string>& patterns) {
    const std::string_view n = trim_view(name);
    for (const auto& p : patterns) {
        if (wildcard_match(p, n)) return true;
    }
    return false;
}

// Counts gathered over the present values of one column; every rule reads from here.
struct column_evidence {
    std::size_t present = 0;
    std::size_t unique = 0;
    std::size_t uuid_like = 0;
    std::size_t numeric = 0;
    std::size_t datetime = 0;
    bool all_integral = true;
    bool all_positive_ids = true;   // every present value an integer in [1, id_max_value)
    bool all_bool = true;
    std::size_t bool_literals = 0;  // distinct lower-cased truth literals

    double unique_ratio() const {
        return present ? static_cast<double>(unique) / static_cast<double>(present) : 0.0;
    }
    double ratio(std::size_t n) const {
        return present ? static_cast<double>(n) / static_cast<double>(present) : 0.0;
    }
};

inline column_evidence gather_evidence(const std::vector<cell>& values, const profile_config& cfg) {
    column_evidence ev;
    std::unordered_set<std::string> distinct;
    std::unordered_set<std::string> literals;
    for (const auto& c : values) {
        if (is_absent(c)) continue;
        ++ev.present;
        distinct.insert(cell_text(c));

        if (is_uuid(c)) ++ev.uuid_like;

        if (ev.all_bool) {
            if (auto lit = bool_literal(c)) literals.insert(*lit);
            else ev.all_bool = false;
        }

        if (auto v = parse_number(c)) {
            ++ev.numeric;
            if (!is_integral(*v)) ev.all_integral = false;
            if (!is_integral(*v) || *v < 1.0 || *v >= cfg.id_max_value()) ev.all_positive_ids = false;
        } else {
            ev.all_positive_ids = false;
        }

        if (parse_datetime(c, cfg.datetime_formats())) ++ev.datetime;
    }
    ev.unique = distinct.size();
    ev.bool_literals = literals.size();
    if (ev.present == 0) {
        ev.all_bool = false;
        ev.all_positive_ids = false;
    }
    return ev;
}

// ---------- rules, in priority order ----------
inline bool is_identifier(std::string_view name, const column_evidence& ev, const profile_config& cfg) {
    if (ev.present == 0) return false;
    const double thr = cfg.id_uniqueness_threshold();
    const bool unique_enough = ev.unique_ratio() > thr;
    if (unique_enough && name_looks_like_id(name, cfg.id_name_patterns())) return true;
    if (ev.uuid_like > 0 && ev.ratio(ev.uuid_like) >= thr) return true;
    if (cfg.detect_numeric_identifiers() && ev.all_positive_ids && unique_enough) return true;
    return false;
}

inline bool is_boolean(const column_evidence& ev) {
    return ev.all_bool && ev.bool_literals <= 2;
}

inline bool is_datetime(const column_evidence& ev, const profile_config& cfg) {
    return ev.datetime > 0 && ev.ratio(ev.datetime) >= cfg.datetime_parse_threshold();
}

inline bool is_numeric(const column_evidence& ev, const profile_config& cfg) {
    return ev.numeric > 0 && ev.ratio(ev.numeric) >= cfg.numeric_parse_threshold();
}

inline bool is_categorical(const column_evidence& ev, const profile_config& cfg) {
    if (ev.present == 0) return false;
    return ev.unique <= cfg.categorical_max_unique_count() ||
           ev.unique_ratio() < cfg.categorical_ratio_threshold();
}

// First matching rule wins: identifier, boolean, single value (categorical), datetime,
// integer/float, categorical, string. Every column gets a type.
inline field_type infer_field_type(std::string_view name,
                                   const std::vector<cell>& values,
                                   const profile_config& cfg) {
    const column_evidence ev = gather_evidence(values, cfg);
    if (ev.present == 0)                 return field_type::string_;
    if (is_identifier(name, ev, cfg))    return field_type::identifier_;
    if (is_boolean(ev))                  return field_type::boolean_;
    if (ev.unique == 1)                  return field_type::categorical_;
    if (is_datetime(ev, cfg))            return field_type::datetime_;
    if (is_numeric(ev, cfg))             return ev.all_integral ? field_type::integer_ : field_type::float_;
    if (is_categorical(ev, cfg))         return field_type::categorical_;
    return field_type::string_;
}

}
