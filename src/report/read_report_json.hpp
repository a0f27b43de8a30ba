#pragma once
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include "profile/profile.hpp"
#include "profile/stats.hpp"
#include "types/cell.hpp"
#include "types/field_type.hpp"
#include "types/parse_date.hpp"

namespace tabprof {

namespace detail {

using json = nlohmann::json;

inline std::optional<double> opt_double(const json& j, const char* key) {
    const auto& v = j.at(key);
    if (v.is_null()) return std::nullopt;
    return v.get<double>();
}

inline std::optional<std::size_t> opt_size(const json& j, const char* key) {
    const auto& v = j.at(key);
    if (v.is_null()) return std::nullopt;
    return v.get<std::size_t>();
}

inline instant_us instant_from(const json& v, const char* key) {
    const std::string s = v.get<std::string>();
    if (auto t = parse_instant(s)) return *t;
    throw std::runtime_error(std::string("report JSON: '") + key + "' is not a timestamp: " + s);
}

inline std::optional<instant_us> opt_instant(const json& j, const char* key) {
    const auto& v = j.at(key);
    if (v.is_null()) return std::nullopt;
    return instant_from(v, key);
}

inline cell cell_from(const json& v) {
    if (v.is_null())            return cell{};
    if (v.is_boolean())         return cell{ v.get<bool>() };
    if (v.is_number_integer())  return cell{ v.get<std::int64_t>() };
    if (v.is_number_float())    return cell{ v.get<double>() };
    if (v.is_string())          return cell{ v.get<std::string>() };
    throw std::runtime_error("report JSON: sample value is not a scalar: " + v.dump());
}

inline numerical_stats numerical_from(const json& j) {
    numerical_stats s;
    s.min_value = opt_double(j, "min_value");
    s.max_value = opt_double(j, "max_value");
    s.mean      = opt_double(j, "mean");
    s.median    = opt_double(j, "median");
    s.std_dev   = opt_double(j, "std_dev");
    const auto& q = j.at("quartiles");
    if (!q.is_null())
        s.quartiles = quartiles{ q.at("q25").get<double>(), q.at("q50").get<double>(), q.at("q75").get<double>() };
    s.missing_count      = j.at("missing_count").get<std::size_t>();
    s.missing_percentage = j.at("missing_percentage").get<double>();
    return s;
}

inline categorical_stats categorical_from(const json& j) {
    categorical_stats s;
    s.unique_count = j.at("unique_count").get<std::size_t>();
    for (const auto& t : j.at("top_values")) {
        s.top_values.push_back(top_value{ t.at("value").get<std::string>(),
                                          t.at("count").get<std::size_t>(),
                                          t.at("percentage").get<double>() });
    }
    s.missing_count      = j.at("missing_count").get<std::size_t>();
    s.missing_percentage = j.at("missing_percentage").get<double>();
    return s;
}

inline string_stats string_from(const json& j) {
    string_stats s;
    s.min_length   = opt_size(j, "min_length");
    s.max_length   = opt_size(j, "max_length");
    s.avg_length   = opt_double(j, "avg_length");
    s.unique_count = j.at("unique_count").get<std::size_t>();
    s.missing_count      = j.at("missing_count").get<std::size_t>();
    s.missing_percentage = j.at("missing_percentage").get<double>();
    return s;
}

inline datetime_stats datetime_from(const json& j) {
    datetime_stats s;
    s.min_date     = opt_instant(j, "min_date");
    s.max_date     = opt_instant(j, "max_date");
    s.unique_count = j.at("unique_count").get<std::size_t>();
    s.missing_count      = j.at("missing_count").get<std::size_t>();
    s.missing_percentage = j.at("missing_percentage").get<double>();
    return s;
}

// The block named by field_type must be the one present; the other three must be null.
inline column_profile field_from(const json& j) {
    column_profile f;
    f.name = j.at("name").get<std::string>();
    const std::string type_name = j.at("field_type").get<std::string>();
    const auto t = parse_field_type(type_name);
    if (!t) throw std::runtime_error("report JSON: unknown field_type '" + type_name + "' in field '" + f.name + "'");
    f.type = *t;
    f.total_count = j.at("total_count").get<std::size_t>();

    const char* expected = "string_stats";
    if (uses_categorical_stats(f.type))          expected = "categorical_stats";
    else if (is_numeric(f.type))                 expected = "numerical_stats";
    else if (f.type == field_type::datetime_)    expected = "datetime_stats";

    for (const char* key : {"categorical_stats", "numerical_stats", "string_stats", "datetime_stats"}) {
        const bool is_null = j.at(key).is_null();
        if (std::string(key) == expected && is_null)
            throw std::runtime_error("report JSON: field '" + f.name + "' is missing " + key);
        if (std::string(key) != expected && !is_null)
            throw std::runtime_error("report JSON: field '" + f.name + "' has unexpected " + key);
    }

    const auto& block = j.at(expected);
    if (uses_categorical_stats(f.type))          f.stats = categorical_from(block);
    else if (is_numeric(f.type))                 f.stats = numerical_from(block);
    else if (f.type == field_type::datetime_)    f.stats = datetime_from(block);
    else                                         f.stats = string_from(block);

    for (const auto& v : j.at("sample_values")) f.sample_values.push_back(cell_from(v));
    return f;
}

} // namespace detail

// Inverse of to_json(); completeness is recomputed since the wire shape lacks it.
// Throws std::runtime_error on malformed JSON or a shape mismatch.
inline analysis_report from_json(const std::string& text) {
    using detail::json;
    try {
        const json j = json::parse(text);
        analysis_report r;
        r.source.path   = j.at("file_path").get<std::string>();
        r.source.format = j.at("file_type").get<std::string>();
        r.total_rows    = j.at("total_rows").get<std::size_t>();
        r.total_columns = j.at("total_columns").get<std::size_t>();
        for (const auto& f : j.at("fields")) r.fields.push_back(detail::field_from(f));
        r.analysis_timestamp      = detail::instant_from(j.at("analysis_timestamp"), "analysis_timestamp");
        r.processing_time_seconds = j.at("processing_time_seconds").get<double>();
        r.completeness_percentage = completeness_percentage(r.fields, r.total_rows);
        return r;
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("report JSON: ") + e.what());
    }
}

inline analysis_report read_report_json(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("Failed to open: " + path);
    std::ostringstream oss; oss << f.rdbuf();
    return from_json(oss.str());
}

}
