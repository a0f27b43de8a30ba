#include <fmt/format.h>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "../cli/cli_options.hpp"
#include "../csv/csv_reader.hpp"
#include "../metrics/timers.hpp"
#include "../profile/profile.hpp"
#include "../profile/profile_config.hpp"
#include "../profile/sample.hpp"
#include "../report/emit_report_json.hpp"
#include "../report/read_report_json.hpp"
#include "../report/render_summary.hpp"

namespace fs = std::filesystem;
using namespace tabprof;

// Configuration problems are reported apart from other failures (exit code 3).
struct config_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// ---------- StageTimer (prints "INFO: <stage> <ms>" when verbose) ----------
struct StageTimer {
    std::string name;
    bool        verbose = false;
    WallTimer   wt{};

    StageTimer(const char* n, bool v) : name(n ? n : "(stage)"), verbose(v) {}
    void start() { wt.start(); }
    void stop()  {
        wt.stop();
        if (verbose) fmt::print(stderr, "INFO: {} took {:.1f} ms\n", name, wt.ms());
    }
};

static profile_config build_config(const profile_options& opts) {
    try {
        return profile_config{opts};
    } catch (const std::invalid_argument& e) {
        throw config_error(e.what());
    }
}

static int run_analyze(const AppOptions& opt) {
    const profile_config cfg = build_config(opt.profile);

    fs::path input_path = opt.input;
    if (!fs::exists(input_path)) {
        fmt::print(stderr, "ERROR: input not found: {}\n", input_path.string());
        return 2; // IO error
    }
    if (opt.verbose) {
        fmt::print(stderr, "INFO: analyzing {}\n", input_path.string());
        fmt::print(stderr, "INFO: categorical ratio threshold {}\n", cfg.categorical_ratio_threshold());
    }

    StageTimer st_load("load_csv", opt.verbose);
    st_load.start();
    const dataset ds = load_csv(input_path, csv_options_from(opt));
    st_load.stop();
    if (ds.row_count == 0) {
        fmt::print(stderr, "WARN: {} has no data rows\n", input_path.string());
    }

    StageTimer st_profile("profile_columns", opt.verbose);
    st_profile.start();
    const analysis_report report = profile_dataset(ds, cfg);
    st_profile.stop();
    if (opt.verbose) {
        fmt::print(stderr, "INFO: {} rows, {} columns\n", report.total_rows, report.total_columns);
    }

    if (!opt.output_json.empty()) {
        StageTimer st_write("write_json", opt.verbose);
        st_write.start();
        write_report_json(report, opt.output_json);
        st_write.stop();
        fmt::print("OK {}\n", opt.output_json);
        return 0;
    }

    fmt::print("{}", render_summary(report));

    const auto mode = parse_sample_mode(opt.sample_mode).value_or(sample_mode::head);
    const auto rows = select_sample_rows(ds, opt.sample_rows, mode, opt.seed);
    if (!rows.empty()) {
        std::vector<std::string> names;
        names.reserve(ds.columns.size());
        for (const auto& c : ds.columns) names.push_back(c.name);
        fmt::print("\nSample rows ({}):\n{}", to_string(mode), render_sample_table(names, rows));
    }
    return 0;
}

static int run_summary(const AppOptions& opt) {
    if (!fs::exists(opt.report_json)) {
        fmt::print(stderr, "ERROR: report not found: {}\n", opt.report_json);
        return 2;
    }
    const analysis_report report = read_report_json(opt.report_json);
    fmt::print("{}", render_summary(report));
    return 0;
}

int main(int argc, char** argv) try {
    const auto opt = parse_cli(argc, argv);
    return opt.cmd == command::summary ? run_summary(opt) : run_analyze(opt);
}
catch (const cli_exit& e) {
    return e.code; // CLI11 already printed help / version / usage error
}
catch (const config_error& e) {
    fmt::print(stderr, "ERROR: invalid configuration: {}\n", e.what());
    return 3;
}
catch (const std::exception& e) {
    fmt::print(stderr, "ERROR: {}\n", e.what());
    return 4; // internal error
}
