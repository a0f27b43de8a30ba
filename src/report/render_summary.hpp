#pragma once
#include <fmt/format.h>
#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "profile/profile.hpp"
#include "profile/sample.hpp"
#include "profile/summary.hpp"
#include "types/cell.hpp"
#include "util/text.hpp"

namespace tabprof {

// Plain-text analysis summary for the terminal.
inline std::string render_summary(const analysis_report& r) {
    const report_summary s = summarize(r);
    const std::string rule(60, '=');

    std::string out;
    out += fmt::format("\n{}\nANALYSIS SUMMARY\n{}\n", rule, rule);
    out += fmt::format("File: {}\n", r.source.path);
    out += fmt::format("Type: {}\n", to_lower(r.source.format));
    out += fmt::format("Rows: {}\n", r.total_rows);
    out += fmt::format("Columns: {}\n", r.total_columns);
    out += fmt::format("Processing time: {:.2f}s\n", r.processing_time_seconds);

    out += "\nField types:\n";
    for (const auto& [type, count] : s.type_counts) out += fmt::format("  - {}: {}\n", type, count);

    out += "\nData quality:\n";
    out += fmt::format("  - Completeness: {:.1f}%\n", s.completeness_percentage);
    out += fmt::format("  - Missing values: {}\n", s.total_missing);
    out += rule;
    out += "\n";
    return out;
}

// Fixed-width table of sample rows; long cells are cut to max_width characters.
inline std::string render_sample_table(const std::vector<std::string>& names,
                                       const std::vector<sample_row>& rows,
                                       std::size_t max_width = 18) {
    auto clip = [max_width](std::string s) {
        if (s.size() > max_width) { s.resize(max_width - 1); s += "~"; }
        return s;
    };

    std::vector<std::vector<std::string>> grid;
    grid.reserve(rows.size() + 1);
    std::vector<std::string> head{"#"};
    for (const auto& n : names) head.push_back(clip(n));
    grid.push_back(std::move(head));
    for (const auto& row : rows) {
        std::vector<std::string> line{fmt::format("{}", row.index)};
        for (const auto& c : row.values) line.push_back(clip(cell_text(c)));
        grid.push_back(std::move(line));
    }

    std::vector<std::size_t> widths(grid.front().size(), 0);
    for (const auto& line : grid)
        for (std::size_t i = 0; i < line.size() && i < widths.size(); ++i)
            widths[i] = std::max(widths[i], line[i].size());

    std::string out;
    for (const auto& line : grid) {
        for (std::size_t i = 0; i < line.size() && i < widths.size(); ++i) {
            out += fmt::format("{:<{}}", line[i], widths[i]);
            out += (i + 1 < line.size()) ? "  " : "";
        }
        out += "\n";
    }
    return out;
}

}
