#pragma once
#include <fmt/format.h>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

#include "profile/profile.hpp"
#include "profile/stats.hpp"
#include "types/cell.hpp"
#include "types/field_type.hpp"
#include "types/parse_date.hpp"
#include "util/json_escape.hpp"

namespace tabprof {

// ---------- scalar helpers ----------
inline std::string json_opt(const std::optional<double>& v) {
    return v ? json_number(*v) : "null";
}
inline std::string json_opt(const std::optional<std::size_t>& v) {
    return v ? fmt::format("{}", *v) : "null";
}
inline std::string json_opt_instant(const std::optional<instant_us>& v) {
    return v ? json_quote(format_instant(*v)) : "null";
}

inline std::string json_cell(const cell& c) {
    struct visitor {
        std::string operator()(std::monostate) const { return "null"; }
        std::string operator()(bool b) const { return b ? "true" : "false"; }
        std::string operator()(std::int64_t v) const { return fmt::format("{}", v); }
        std::string operator()(double v) const { return json_number(v); }
        std::string operator()(const std::string& s) const { return json_quote(s); }
    };
    return std::visit(visitor{}, c);
}

// ---------- stats blocks ----------
inline std::string json_block(const numerical_stats& s) {
    std::string q = "null";
    if (s.quartiles) {
        q = fmt::format(R"({{"q25":{},"q50":{},"q75":{}}})",
                        json_number(s.quartiles->q25), json_number(s.quartiles->q50),
                        json_number(s.quartiles->q75));
    }
    return fmt::format(
        R"({{"min_value":{},"max_value":{},"mean":{},"median":{},"std_dev":{},"quartiles":{},"missing_count":{},"missing_percentage":{}}})",
        json_opt(s.min_value), json_opt(s.max_value), json_opt(s.mean), json_opt(s.median),
        json_opt(s.std_dev), q, s.missing_count, json_number(s.missing_percentage));
}

inline std::string json_block(const categorical_stats& s) {
    std::string tops = "[";
    for (std::size_t i = 0; i < s.top_values.size(); ++i) {
        const auto& t = s.top_values[i];
        tops += fmt::format(R"({{"value":{},"count":{},"percentage":{}}})",
                            json_quote(t.value), t.count, json_number(t.percentage));
        if (i + 1 < s.top_values.size()) tops += ",";
    }
    tops += "]";
    return fmt::format(
        R"({{"unique_count":{},"top_values":{},"missing_count":{},"missing_percentage":{}}})",
        s.unique_count, tops, s.missing_count, json_number(s.missing_percentage));
}

inline std::string json_block(const string_stats& s) {
    return fmt::format(
        R"({{"min_length":{},"max_length":{},"avg_length":{},"unique_count":{},"missing_count":{},"missing_percentage":{}}})",
        json_opt(s.min_length), json_opt(s.max_length), json_opt(s.avg_length),
        s.unique_count, s.missing_count, json_number(s.missing_percentage));
}

inline std::string json_block(const datetime_stats& s) {
    return fmt::format(
        R"({{"min_date":{},"max_date":{},"unique_count":{},"missing_count":{},"missing_percentage":{}}})",
        json_opt_instant(s.min_date), json_opt_instant(s.max_date),
        s.unique_count, s.missing_count, json_number(s.missing_percentage));
}

// Exactly one of the four blocks is non-null, picked by which alternative the stats hold.
inline std::string json_field(const column_profile& f) {
    std::string cat = "null", num = "null", str = "null", dt = "null";
    std::visit([&](const auto& b) {
        using T = std::decay_t<decltype(b)>;
        if constexpr (std::is_same_v<T, categorical_stats>) cat = json_block(b);
        else if constexpr (std::is_same_v<T, numerical_stats>) num = json_block(b);
        else if constexpr (std::is_same_v<T, string_stats>) str = json_block(b);
        else dt = json_block(b);
    }, f.stats);

    std::string samples = "[";
    for (std::size_t i = 0; i < f.sample_values.size(); ++i) {
        samples += json_cell(f.sample_values[i]);
        if (i + 1 < f.sample_values.size()) samples += ",";
    }
    samples += "]";

    return fmt::format(
R"(    {{
      "name":{},
      "field_type":"{}",
      "total_count":{},
      "categorical_stats":{},
      "numerical_stats":{},
      "string_stats":{},
      "datetime_stats":{},
      "sample_values":{}
    }})",
        json_quote(f.name), to_string(f.type), f.total_count, cat, num, str, dt, samples);
}

// ---------- report ----------
inline std::string to_json(const analysis_report& r) {
    std::string out = fmt::format(
R"({{
  "file_path":{},
  "file_type":{},
  "total_rows":{},
  "total_columns":{},
  "fields":[)",
        json_quote(r.source.path), json_quote(r.source.format), r.total_rows, r.total_columns);

    for (std::size_t i = 0; i < r.fields.size(); ++i) {
        out += "\n";
        out += json_field(r.fields[i]);
        if (i + 1 < r.fields.size()) out += ",";
    }
    out += r.fields.empty() ? "],\n" : "\n  ],\n";
    out += fmt::format(R"(  "analysis_timestamp":{},)", json_quote(format_instant(r.analysis_timestamp, true)));
    out += "\n";
    out += fmt::format(R"(  "processing_time_seconds":{})", json_number(r.processing_time_seconds));
    out += "\n}\n";
    return out;
}

inline void write_report_json(const analysis_report& r, const std::string& out_path) {
    std::ofstream f(out_path, std::ios::binary);
    if (!f) throw std::runtime_error("Failed to open for write: " + out_path);
    f << to_json(r);
    if (!f) throw std::runtime_error("Failed to write: " + out_path);
}

}
