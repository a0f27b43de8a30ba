// src/csv/csv_reader.hpp
#pragma once
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <istream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "io/file_stats.hpp"
#include "types/cell.hpp"
#include "types/dataset.hpp"
#include "util/nulls.hpp"

namespace tabprof {

struct csv_options {
    char delimiter = ',';
    char quote     = '"';
    bool header_present = true;
    std::vector<std::string> null_tokens = default_null_tokens();
};

// ---------- tiny CSV record parser (RFC4180-ish, covers quotes) ----------
inline std::vector<std::string> parse_csv_line(const std::string& line, char delim, char quote){
    std::vector<std::string> out;
    std::string cur;
    bool inq = false;

    for (size_t i=0;i<line.size();++i){
        char c = line[i];
        if (inq){
            if (c == quote){
                // double-quote escape -> append one quote, stay in quoted field
                if (i+1<line.size() && line[i+1]==quote){ cur.push_back(quote); ++i; }
                else { inq = false; }
            } else {
                cur.push_back(c);
            }
        } else {
            if (c == quote){ inq = true; }
            else if (c == delim){ out.push_back(cur); cur.clear(); }
            else { cur.push_back(c); }
        }
    }
    out.push_back(cur);
    return out;
}

// True while a quoted field is still open at the end of `rec`.
inline bool quote_open(const std::string& rec, char quote) {
    bool inq = false;
    for (char c : rec) if (c == quote) inq = !inq;
    return inq;
}

// Reads one logical record; quoted fields may span physical lines.
inline bool read_csv_record(std::istream& is, std::string& rec, char quote) {
    rec.clear();
    std::string line;
    bool any = false;
    while (std::getline(is, line)) {
        // handle CRLF
        if (!line.empty() && line.back()=='\r') line.pop_back();
        if (any) rec += '\n';
        rec += line;
        any = true;
        if (!quote_open(rec, quote)) break;
    }
    return any;
}

// Cells stay raw strings, null tokens become absent, short rows are padded.
inline dataset read_csv(std::istream& is, const csv_options& opt, source_descriptor source = {}) {
    dataset ds;
    ds.source = std::move(source);

    std::string rec;
    std::vector<std::string> names;
    bool header_read = false;
    std::vector<std::vector<cell>> cols;

    auto widen = [&](std::size_t n) {
        for (std::size_t i = names.size(); i < n; ++i) names.push_back("col" + std::to_string(i + 1));
        if (cols.size() < n) cols.resize(n, std::vector<cell>(ds.row_count));
    };

    while (read_csv_record(is, rec, opt.quote)) {
        auto fields = parse_csv_line(rec, opt.delimiter, opt.quote);
        if (!header_read) {
            header_read = true;
            if (opt.header_present) {
                for (std::size_t i = 0; i < fields.size(); ++i) {
                    const std::string n = trim(fields[i]);
                    names.push_back(n.empty() ? "col" + std::to_string(i + 1) : n);
                }
                cols.resize(names.size());
                continue;
            }
        }
        if (rec.empty() && fields.size() == 1) continue;   // blank line

        widen(fields.size());
        for (std::size_t c = 0; c < cols.size(); ++c) {
            if (c < fields.size() && !is_null_like(fields[c], opt.null_tokens))
                cols[c].push_back(cell{ std::move(fields[c]) });
            else
                cols[c].push_back(cell{});
        }
        ++ds.row_count;
    }

    ds.columns.reserve(cols.size());
    for (std::size_t i = 0; i < cols.size(); ++i) {
        ds.columns.push_back(column{ names[i], std::move(cols[i]) });
    }
    return ds;
}

inline dataset load_csv(const std::filesystem::path& path, const csv_options& opt = {}) {
    std::ifstream is(path, std::ios::binary);
    if (!is) throw std::runtime_error("Failed to open: " + path.string());
    return read_csv(is, opt, source_descriptor{ path.string(), file_type_of(path) });
}

}
