// src/profile/compute_stats.hpp
#pragma once
#include <algorithm>
#include <cstddef>
#include <set>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "profile/profile_config.hpp"
#include "profile/profiler.hpp"
#include "profile/stats.hpp"
#include "types/cell.hpp"
#include "types/field_type.hpp"
#include "types/parse_bool.hpp"
#include "types/parse_date.hpp"
#include "types/parse_number.hpp"
#include "util/nulls.hpp"
#include "util/text.hpp"

namespace tabprof {

inline double percent_of(std::size_t part, std::size_t total) {
    return total ? static_cast<double>(part) / static_cast<double>(total) * 100.0 : 0.0;
}

// Cells absent in the source and cells unreadable under the column's type
// both count as missing.
inline numerical_stats compute_numerical_stats(const std::vector<cell>& values) {
    numeric_accumulator acc;
    for (const auto& c : values) {
        if (is_absent(c)) { acc.add_missing(); continue; }
        if (auto v = parse_number(c)) acc.add(*v);
        else acc.add_missing();
    }
    acc.finish();

    numerical_stats s;
    s.missing_count = acc.missing_count();
    s.missing_percentage = percent_of(acc.missing_count(), values.size());
    if (acc.count() == 0) return s;

    s.min_value = acc.min();
    s.max_value = acc.max();
    s.mean      = acc.mean();
    s.median    = acc.quantile(0.5);
    if (acc.count() >= 2) s.std_dev = acc.stddev();
    s.quartiles = quartiles{ acc.quantile(0.25), acc.quantile(0.5), acc.quantile(0.75) };
    return s;
}

// Boolean columns are tallied by canonical "True"/"False"; everything else by text.
inline categorical_stats compute_categorical_stats(field_type t,
                                                   const std::vector<cell>& values,
                                                   std::size_t top_k) {
    frequency_table ft;
    for (const auto& c : values) {
        if (is_absent(c)) { ft.add_missing(); continue; }
        if (t == field_type::boolean_) {
            if (auto b = parse_bool(c)) ft.add(bool_text(*b));
            else ft.add_missing();
        } else {
            ft.add(to_valid_utf8(cell_text(c)));
        }
    }

    categorical_stats s;
    s.unique_count = ft.freq.size();
    s.missing_count = ft.missing_count;
    s.missing_percentage = percent_of(ft.missing_count, values.size());
    for (auto& [value, count] : ft.top(top_k)) {
        s.top_values.push_back(top_value{ value, count, percent_of(count, values.size()) });
    }
    return s;
}

inline string_stats compute_string_stats(const std::vector<cell>& values) {
    string_stats s;
    std::unordered_set<std::string> distinct;
    std::size_t n = 0, total_len = 0;
    for (const auto& c : values) {
        if (is_absent(c)) { ++s.missing_count; continue; }
        std::string text = cell_text(c);
        const std::size_t len = utf8_length(text);
        if (n == 0) { s.min_length = len; s.max_length = len; }
        else {
            s.min_length = std::min(*s.min_length, len);
            s.max_length = std::max(*s.max_length, len);
        }
        total_len += len;
        ++n;
        distinct.insert(std::move(text));
    }
    if (n > 0) s.avg_length = static_cast<double>(total_len) / static_cast<double>(n);
    s.unique_count = distinct.size();
    s.missing_percentage = percent_of(s.missing_count, values.size());
    return s;
}

inline datetime_stats compute_datetime_stats(const std::vector<cell>& values,
                                             const std::vector<std::string>& formats) {
    datetime_stats s;
    std::set<instant_us> distinct;
    for (const auto& c : values) {
        if (is_absent(c)) { ++s.missing_count; continue; }
        const auto t = parse_datetime(c, formats);
        if (!t) { ++s.missing_count; continue; }
        distinct.insert(*t);
    }
    if (!distinct.empty()) {
        s.min_date = *distinct.begin();
        s.max_date = *distinct.rbegin();
    }
    s.unique_count = distinct.size();
    s.missing_percentage = percent_of(s.missing_count, values.size());
    return s;
}

// Stats block for one column, picked by its type. Values stay full precision.
inline field_stats compute_field_stats(field_type t,
                                       const std::vector<cell>& values,
                                       const profile_config& cfg) {
    switch (t) {
        case field_type::integer_:
        case field_type::float_:
            return compute_numerical_stats(values);
        case field_type::datetime_:
            return compute_datetime_stats(values, cfg.datetime_formats());
        case field_type::categorical_:
        case field_type::boolean_:
        case field_type::identifier_:
            return compute_categorical_stats(t, values, cfg.top_k());
        default:
            return compute_string_stats(values);
    }
}

}
