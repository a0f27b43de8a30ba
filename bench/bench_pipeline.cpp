#include "metrics/timers.hpp"
#include "io/file_stats.hpp"
#include "csv/csv_reader.hpp"
#include "profile/profile.hpp"
#include "profile/profile_config.hpp"
#include <fmt/format.h>
#include <string>
#include <string_view>
#include <filesystem>
#include <exception>

using std::string;
namespace fs = std::filesystem;

int main(int argc, char** argv) try {
  // Defaults
  string dataPath;
  size_t threads = 1;

  // Supported:
  //   --data <file>      | --data=<file>
  //   --threads <N>      | --threads=<N>
  // Fallback positional: <input.csv> [threads]
  for (int i=1;i<argc;++i){
    std::string_view a(argv[i]);

    if (a.rfind("--data=",0)==0) {
      dataPath = string(a.substr(7));
    } else if (a == "--data") {
      if (i+1>=argc){ fmt::print(stderr, "missing value for --data\n"); return 2; }
      dataPath = argv[++i];
    } else if (a.rfind("--threads=",0)==0) {
      threads = static_cast<size_t>(std::stoull(string(a.substr(10))));
    } else if (a == "--threads") {
      if (i+1>=argc){ fmt::print(stderr, "missing value for --threads\n"); return 2; }
      threads = static_cast<size_t>(std::stoull(argv[++i]));
    } else if (!dataPath.size() && a.size() && a[0] != '-') {
      dataPath = string(a);
      if (i+1<argc && argv[i+1][0] != '-') {
        ++i;
        threads = static_cast<size_t>(std::stoull(argv[i]));
      }
    }
  }

  if (dataPath.empty()){
    fmt::print(stderr,
      "usage:\n"
      "  tabprof_bench_pipeline <input.csv> [threads]\n"
      "  tabprof_bench_pipeline --data <input.csv> [--threads N]\n");
    return 2;
  }

  const auto bytes = tabprof::file_size_bytes(dataPath);
  if (bytes == 0){
    fmt::print(stderr, "file empty or missing: {}\n", dataPath);
    return 2;
  }

  tabprof::profile_options opts;
  opts.worker_threads = threads;
  const tabprof::profile_config cfg{opts};

  tabprof::WallTimer wt_load; wt_load.start();
  const auto ds = tabprof::load_csv(fs::path(dataPath));
  wt_load.stop();

  tabprof::WallTimer wt_prof; wt_prof.start();
  const auto report = tabprof::profile_dataset(ds, cfg);
  wt_prof.stop();

  const double mb   = double(bytes)/(1024.0*1024.0);
  const double secs = wt_load.seconds() + wt_prof.seconds();
  const double rps  = secs>0? (double(report.total_rows)/secs) : 0.0;

  fmt::print("bench_pipeline,file={},rows={},cols={},threads={},MB={:.2f},load_sec={:.3f},profile_sec={:.3f},rows/s={:.0f}\n",
             dataPath, report.total_rows, report.total_columns, threads, mb,
             wt_load.seconds(), wt_prof.seconds(), rps);
  return 0;
}
catch (const std::exception& e) {
  fmt::print(stderr, "ERROR: {}\n", e.what());
  return 4;
}
