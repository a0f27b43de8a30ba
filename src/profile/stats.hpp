// src/profile/stats.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "types/parse_date.hpp"

namespace tabprof {

// ---------- per-type statistics blocks ----------
struct quartiles {
    double q25{0.0}, q50{0.0}, q75{0.0};
};

struct numerical_stats {
    std::optional<double> min_value, max_value;
    std::optional<double> mean, median;
    std::optional<double> std_dev;            // sample std dev; empty below 2 values
    std::optional<tabprof::quartiles> quartiles;
    std::size_t missing_count{0};
    double      missing_percentage{0.0};
};

struct top_value {
    std::string value;
    std::size_t count{0};
    double      percentage{0.0};
};

struct categorical_stats {
    std::size_t unique_count{0};
    std::vector<top_value> top_values;        // count desc, then value asc
    std::size_t missing_count{0};
    double      missing_percentage{0.0};
};

struct string_stats {
    std::optional<std::size_t> min_length, max_length;
    std::optional<double>      avg_length;
    std::size_t unique_count{0};
    std::size_t missing_count{0};
    double      missing_percentage{0.0};
};

struct datetime_stats {
    std::optional<instant_us> min_date, max_date;
    std::size_t unique_count{0};
    std::size_t missing_count{0};
    double      missing_percentage{0.0};
};

using field_stats = std::variant<numerical_stats, categorical_stats, string_stats, datetime_stats>;

inline std::size_t missing_count(const field_stats& s) {
    return std::visit([](const auto& b) { return b.missing_count; }, s);
}
inline double missing_percentage(const field_stats& s) {
    return std::visit([](const auto& b) { return b.missing_percentage; }, s);
}

// ---------- equality ----------
inline bool operator==(const quartiles& a, const quartiles& b) {
    return a.q25 == b.q25 && a.q50 == b.q50 && a.q75 == b.q75;
}
inline bool operator!=(const quartiles& a, const quartiles& b) { return !(a == b); }

inline bool operator==(const numerical_stats& a, const numerical_stats& b) {
    return a.min_value == b.min_value && a.max_value == b.max_value &&
           a.mean == b.mean && a.median == b.median && a.std_dev == b.std_dev &&
           a.quartiles == b.quartiles &&
           a.missing_count == b.missing_count && a.missing_percentage == b.missing_percentage;
}
inline bool operator!=(const numerical_stats& a, const numerical_stats& b) { return !(a == b); }

inline bool operator==(const top_value& a, const top_value& b) {
    return a.value == b.value && a.count == b.count && a.percentage == b.percentage;
}
inline bool operator!=(const top_value& a, const top_value& b) { return !(a == b); }

inline bool operator==(const categorical_stats& a, const categorical_stats& b) {
    return a.unique_count == b.unique_count && a.top_values == b.top_values &&
           a.missing_count == b.missing_count && a.missing_percentage == b.missing_percentage;
}
inline bool operator!=(const categorical_stats& a, const categorical_stats& b) { return !(a == b); }

inline bool operator==(const string_stats& a, const string_stats& b) {
    return a.min_length == b.min_length && a.max_length == b.max_length &&
           a.avg_length == b.avg_length && a.unique_count == b.unique_count &&
           a.missing_count == b.missing_count && a.missing_percentage == b.missing_percentage;
}
inline bool operator!=(const string_stats& a, const string_stats& b) { return !(a == b); }

inline bool operator==(const datetime_stats& a, const datetime_stats& b) {
    return a.min_date == b.min_date && a.max_date == b.max_date &&
           a.unique_count == b.unique_count &&
           a.missing_count == b.missing_count && a.missing_percentage == b.missing_percentage;
}
inline bool operator!=(const datetime_stats& a, const datetime_stats& b) { return !(a == b); }

}
