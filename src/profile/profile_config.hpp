// src/profile/profile_config.hpp
#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <fmt/format.h>

namespace tabprof {

// Mutable knob set; turned into an immutable profile_config once per run.
struct profile_options {
    // identifier detection
    std::vector<std::string> id_name_patterns = {
        "id", "*_id", "id_*", "*identifier*", "*key", "*code", "uuid", "*uuid*", "pk", "*pk"
    };
    double id_uniqueness_threshold    = 0.9;
    bool   detect_numeric_identifiers = false;
    double id_max_value               = 1e12;

    // datetime / numeric detection
    std::vector<std::string> datetime_formats = {
        "%Y-%m-%d %H:%M:%S", "%Y-%m-%dT%H:%M:%S", "%Y-%m-%d %H:%M",
        "%Y-%m-%d", "%Y/%m/%d", "%m/%d/%Y", "%d.%m.%Y"
    };
    double datetime_parse_threshold = 1.0;
    double numeric_parse_threshold  = 0.95;

    // categorical detection
    std::size_t categorical_max_unique_count = 20;
    double      categorical_ratio_threshold  = 0.5;

    // report shape
    std::size_t top_k              = 3;
    std::size_t sample_value_count = 5;

    // 1 = sequential; >1 profiles columns concurrently
    std::size_t worker_threads = 1;
};

class profile_config {
public:
    profile_config() : profile_config(profile_options{}) {}

    // Throws std::invalid_argument naming the first bad option.
    explicit profile_config(profile_options opt) : opt_(std::move(opt)) {
        auto unit = [](double v, const char* name) {
            if (!(v >= 0.0 && v <= 1.0))
                throw std::invalid_argument(fmt::format("{} must be in [0, 1] (got {})", name, v));
        };
        unit(opt_.id_uniqueness_threshold,     "id_uniqueness_threshold");
        unit(opt_.datetime_parse_threshold,    "datetime_parse_threshold");
        unit(opt_.numeric_parse_threshold,     "numeric_parse_threshold");
        unit(opt_.categorical_ratio_threshold, "categorical_ratio_threshold");

        if (!(opt_.id_max_value > 0.0))
            throw std::invalid_argument(fmt::format("id_max_value must be > 0 (got {})", opt_.id_max_value));
        if (opt_.top_k == 0)
            throw std::invalid_argument("top_k must be > 0");
        if (opt_.sample_value_count == 0)
            throw std::invalid_argument("sample_value_count must be > 0");
        if (opt_.worker_threads == 0)
            throw std::invalid_argument("worker_threads must be > 0");
        for (const auto& p : opt_.id_name_patterns)
            if (p.empty()) throw std::invalid_argument("id_name_patterns must not contain empty patterns");
        for (const auto& f : opt_.datetime_formats)
            if (f.empty()) throw std::invalid_argument("datetime_formats must not contain empty formats");
    }

    const std::vector<std::string>& id_name_patterns() const noexcept { return opt_.id_name_patterns; }
    double id_uniqueness_threshold() const noexcept { return opt_.id_uniqueness_threshold; }
    bool   detect_numeric_identifiers() const noexcept { return opt_.detect_numeric_identifiers; }
    double id_max_value() const noexcept { return opt_.id_max_value; }

    const std::vector<std::string>& datetime_formats() const noexcept { return opt_.datetime_formats; }
    double datetime_parse_threshold() const noexcept { return opt_.datetime_parse_threshold; }
    double numeric_parse_threshold() const noexcept { return opt_.numeric_parse_threshold; }

    std::size_t categorical_max_unique_count() const noexcept { return opt_.categorical_max_unique_count; }
    double      categorical_ratio_threshold() const noexcept { return opt_.categorical_ratio_threshold; }

    std::size_t top_k() const noexcept { return opt_.top_k; }
    std::size_t sample_value_count() const noexcept { return opt_.sample_value_count; }
    std::size_t worker_threads() const noexcept { return opt_.worker_threads; }

    const profile_options& options() const noexcept { return opt_; }

private:
    profile_options opt_;
};

}
