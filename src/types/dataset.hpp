// src/types/dataset.hpp
#pragma once
#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>
#include <fmt/format.h>

#include "types/cell.hpp"

namespace tabprof {

struct source_descriptor {
    std::string path;
    std::string format;   // "csv" | "json" | "xlsx" | "parquet" | ...
};

struct column {
    std::string       name;
    std::vector<cell> values;
};

// Caller-owned, read-only input of one profiling run.
struct dataset {
    source_descriptor source;
    std::chrono::system_clock::time_point created_at = std::chrono::system_clock::now();
    std::size_t row_count = 0;
    std::vector<column> columns;

    // Every column must carry exactly row_count cells.
    void validate() const {
        for (const auto& c : columns) {
            if (c.values.size() != row_count) {
                throw std::invalid_argument(fmt::format(
                    "column '{}' has {} values, dataset has {} rows",
                    c.name, c.values.size(), row_count));
            }
        }
    }
};

}
