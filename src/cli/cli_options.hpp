#pragma once
#include <CLI/CLI.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "csv/csv_reader.hpp"
#include "profile/profile_config.hpp"
#include "profile/sample.hpp"

namespace tabprof {

enum class command { analyze, summary };

// Thrown once CLI11 has printed help, version or a parse error; carries the exit code.
struct cli_exit {
    int code = 0;
};

struct AppOptions {
    command cmd = command::analyze;

    // analyze
    std::string input;
    std::string output_json;
    std::size_t sample_rows = 5;
    std::string sample_mode = "head";   // head | random
    std::optional<std::uint64_t> seed;
    bool verbose = false;

    // CSV parsing
    std::string delimiter = ",";        // single char, e.g. ","
    std::string quote     = "\"";       // single char, e.g. "\""
    bool        has_header = true;      // header row present?

    // summary
    std::string report_json;

    // heuristics; validated later by profile_config
    profile_options profile;
};

inline AppOptions parse_cli(int argc, char** argv) {
    AppOptions opt;
    CLI::App app{"tabprof - tabular dataset profiler"};
    app.set_version_flag("--version", "0.1.0");
    app.require_subcommand(1);

    // --- analyze
    auto* analyze = app.add_subcommand("analyze", "Profile a CSV file");
    analyze->add_option("input", opt.input, "Path to input CSV")->required();
    analyze->add_option("-j,--output-json", opt.output_json, "Write the JSON report here");
    analyze->add_option("--sample-rows", opt.sample_rows, "Rows shown in the sample table")->default_val(5);
    analyze->add_option("--sample-mode", opt.sample_mode, "Sample selection: head | random")
        ->default_val("head")->check(CLI::IsMember({"head", "random"}));
    analyze->add_option("--seed", opt.seed, "Seed for --sample-mode random");
    analyze->add_flag("-v,--verbose", opt.verbose, "Print stage timings");

    analyze->add_option("-d,--delimiter", opt.delimiter,
                        "CSV delimiter (single character, default ',')")->default_val(",");
    analyze->add_option("-q,--quote", opt.quote,
                        "CSV quote (single character, default '\"')")->default_val("\"");
    analyze->add_option("--has-header", opt.has_header,
                        "CSV has a header row (true/false)")->default_val(true);

    auto& p = opt.profile;
    analyze->add_option("--id-pattern", p.id_name_patterns,
                        "Identifier column-name pattern ('*' wildcard); repeat to replace the defaults");
    analyze->add_option("--id-uniqueness", p.id_uniqueness_threshold,
                        "Uniqueness ratio an identifier must exceed")->capture_default_str();
    analyze->add_flag("--numeric-ids", p.detect_numeric_identifiers,
                      "Treat unique positive integer columns as identifiers regardless of name");
    analyze->add_option("--datetime-format", p.datetime_formats,
                        "strftime-style datetime format; repeat to replace the defaults");
    analyze->add_option("--datetime-threshold", p.datetime_parse_threshold,
                        "Share of values that must parse as datetimes")->capture_default_str();
    analyze->add_option("--numeric-threshold", p.numeric_parse_threshold,
                        "Share of values that must parse as numbers")->capture_default_str();
    analyze->add_option("--categorical-max-unique", p.categorical_max_unique_count,
                        "Distinct-value count at or below which a column is categorical")->capture_default_str();
    analyze->add_option("-t,--categorical-ratio", p.categorical_ratio_threshold,
                        "Distinct/present ratio below which a column is categorical")->capture_default_str();
    analyze->add_option("--top-k", p.top_k, "Top values kept per categorical column")->capture_default_str();
    analyze->add_option("--sample-values", p.sample_value_count,
                        "Sample values kept per column")->capture_default_str();
    analyze->add_option("--threads", p.worker_threads, "Columns profiled concurrently")->capture_default_str();

    // --- summary
    auto* summary = app.add_subcommand("summary", "Print the summary of a saved JSON report");
    summary->add_option("report", opt.report_json, "Path to report JSON")->required();

    app.allow_windows_style_options();
    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // help and version exit 0; every usage error exits 1
        throw cli_exit{ app.exit(e) == 0 ? 0 : 1 };
    }

    opt.cmd = summary->parsed() ? command::summary : command::analyze;

    // --- Validation ---
    auto one_char = [&](const std::string& s, const char* name){
        if (s.size() != 1) {
            const int rc = app.exit(CLI::ValidationError{name, "must be a single character"});
            throw cli_exit{ rc == 0 ? 0 : 1 };
        }
    };
    if (opt.cmd == command::analyze) {
        one_char(opt.delimiter, "delimiter");
        one_char(opt.quote,     "quote");
    }

    return opt;
}

inline csv_options csv_options_from(const AppOptions& opt) {
    csv_options c;
    c.delimiter = opt.delimiter[0];
    c.quote = opt.quote[0];
    c.header_present = opt.has_header;
    return c;
}

}
