#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <numeric>
#include <optional>
#include <random>
#include <string_view>
#include <vector>

#include "types/cell.hpp"
#include "types/dataset.hpp"

namespace tabprof {

enum class sample_mode { head, random };

inline const char* to_string(sample_mode m) { return m == sample_mode::head ? "head" : "random"; }

inline std::optional<sample_mode> parse_sample_mode(std::string_view s) {
    if (s == "head")   return sample_mode::head;
    if (s == "random") return sample_mode::random;
    return std::nullopt;
}

// One source row, verbatim, with its position in the dataset.
struct sample_row {
    std::size_t       index = 0;
    std::vector<cell> values;
};

inline bool operator==(const sample_row& a, const sample_row& b) {
    return a.index == b.index && a.values == b.values;
}

// Process-level random source, one engine per thread.
inline std::mt19937_64& process_rng() {
    thread_local std::mt19937_64 rng{ std::random_device{}() };
    return rng;
}

inline sample_row row_at(const dataset& ds, std::size_t r) {
    sample_row row;
    row.index = r;
    row.values.reserve(ds.columns.size());
    for (const auto& c : ds.columns) row.values.push_back(r < c.values.size() ? c.values[r] : cell{});
    return row;
}

// Up to n rows for display; random picks keep source order, a seed makes them repeatable.
inline std::vector<sample_row> select_sample_rows(const dataset& ds,
                                                  std::size_t n,
                                                  sample_mode mode,
                                                  std::optional<std::uint64_t> seed = std::nullopt) {
    const std::size_t take = std::min(n, ds.row_count);
    std::vector<std::size_t> picked;
    picked.reserve(take);

    if (mode == sample_mode::head) {
        for (std::size_t r = 0; r < take; ++r) picked.push_back(r);
    } else {
        std::vector<std::size_t> all(ds.row_count);
        std::iota(all.begin(), all.end(), std::size_t{0});
        // selection sampling over a forward range keeps the source order
        if (seed) {
            std::mt19937_64 rng{ *seed };
            std::sample(all.begin(), all.end(), std::back_inserter(picked), take, rng);
        } else {
            std::sample(all.begin(), all.end(), std::back_inserter(picked), take, process_rng());
        }
        std::sort(picked.begin(), picked.end());
    }

    std::vector<sample_row> rows;
    rows.reserve(picked.size());
    for (std::size_t r : picked) rows.push_back(row_at(ds, r));
    return rows;
}

}
