// src/profile/profile.hpp
#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <future>
#include <string>
#include <variant>
#include <vector>

#include "metrics/timers.hpp"
#include "profile/compute_stats.hpp"
#include "profile/profile_config.hpp"
#include "profile/stats.hpp"
#include "types/cell.hpp"
#include "types/dataset.hpp"
#include "types/field_type.hpp"
#include "types/infer.hpp"
#include "types/parse_date.hpp"
#include "util/nulls.hpp"
#include "util/text.hpp"

namespace tabprof {

// ---------- data model ----------
struct column_profile {
    std::string       name;
    field_type        type = field_type::string_;
    std::size_t       total_count = 0;      // present (non-absent) cells
    field_stats       stats;
    std::vector<cell> sample_values;        // first present values, source order
};

struct analysis_report {
    source_descriptor source;
    std::size_t total_rows = 0;
    std::size_t total_columns = 0;
    std::vector<column_profile> fields;
    instant_us analysis_timestamp = 0;
    double processing_time_seconds = 0.0;
    double completeness_percentage = 0.0;
};

inline bool operator==(const column_profile& a, const column_profile& b) {
    return a.name == b.name && a.type == b.type && a.total_count == b.total_count &&
           a.stats == b.stats && a.sample_values == b.sample_values;
}
inline bool operator!=(const column_profile& a, const column_profile& b) { return !(a == b); }

inline bool operator==(const analysis_report& a, const analysis_report& b) {
    return a.source.path == b.source.path && a.source.format == b.source.format &&
           a.total_rows == b.total_rows && a.total_columns == b.total_columns &&
           a.fields == b.fields &&
           a.analysis_timestamp == b.analysis_timestamp &&
           a.processing_time_seconds == b.processing_time_seconds &&
           a.completeness_percentage == b.completeness_percentage;
}
inline bool operator!=(const analysis_report& a, const analysis_report& b) { return !(a == b); }

// ---------- assembly ----------
// 100 minus the mean per-column missing percentage, rounded to 2 decimals.
// A report without cells has nothing to be complete about and scores 0.
inline double completeness_percentage(const std::vector<column_profile>& fields, std::size_t total_rows) {
    if (fields.empty() || total_rows == 0) return 0.0;
    double sum = 0.0;
    for (const auto& f : fields) sum += missing_percentage(f.stats);
    const double pct = 100.0 - sum / static_cast<double>(fields.size());
    return std::round(pct * 100.0) / 100.0;
}

inline column_profile profile_column(const column& col, const profile_config& cfg) {
    column_profile p;
    p.name  = to_valid_utf8(col.name);
    p.type  = infer_field_type(col.name, col.values, cfg);
    p.stats = compute_field_stats(p.type, col.values, cfg);
    for (const auto& c : col.values) {
        if (is_absent(c)) continue;
        ++p.total_count;
        if (p.sample_values.size() >= cfg.sample_value_count()) continue;
        // report text is always valid UTF-8 so it survives the JSON round trip
        if (const auto* s = std::get_if<std::string>(&c)) p.sample_values.push_back(cell{ to_valid_utf8(*s) });
        else p.sample_values.push_back(c);
    }
    return p;
}

// Columns are independent; with worker_threads > 1 they are profiled in batches of
// that size. Results land by column index, so output order is source order either way.
inline std::vector<column_profile> profile_columns(const dataset& ds, const profile_config& cfg) {
    std::vector<column_profile> out(ds.columns.size());
    const std::size_t workers = cfg.worker_threads();
    if (workers <= 1 || ds.columns.size() <= 1) {
        for (std::size_t i = 0; i < ds.columns.size(); ++i) out[i] = profile_column(ds.columns[i], cfg);
        return out;
    }
    for (std::size_t base = 0; base < ds.columns.size(); base += workers) {
        const std::size_t end = std::min(base + workers, ds.columns.size());
        std::vector<std::future<column_profile>> batch;
        batch.reserve(end - base);
        for (std::size_t i = base; i < end; ++i) {
            batch.push_back(std::async(std::launch::async,
                                       [&ds, &cfg, i] { return profile_column(ds.columns[i], cfg); }));
        }
        for (std::size_t i = base; i < end; ++i) out[i] = batch[i - base].get();
    }
    return out;
}

// Throws std::invalid_argument when the columns disagree in length.
inline analysis_report profile_dataset(const dataset& ds, const profile_config& cfg) {
    ds.validate();
    WallTimer wt; wt.start();

    analysis_report r;
    r.source        = source_descriptor{ to_valid_utf8(ds.source.path), to_valid_utf8(ds.source.format) };
    r.total_rows    = ds.row_count;
    r.total_columns = ds.columns.size();
    r.fields        = profile_columns(ds, cfg);
    r.completeness_percentage = completeness_percentage(r.fields, r.total_rows);
    r.analysis_timestamp      = now_epoch_us();

    wt.stop();
    r.processing_time_seconds = wt.seconds();
    return r;
}

}
