// Writes a synthetic CSV that exercises every field type the profiler knows.
#include <cstdio>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <random>
#include <fstream>
#include <iostream>

int main(int argc, char** argv){
  if (argc < 4){
    std::cerr << "usage: tabprof_gen_synth_csv <out.csv> <rows> <quoted:0|1>\n";
    return 2;
  }
  const std::string out = argv[1];
  const std::uint64_t rows = std::strtoull(argv[2], nullptr, 10);
  const bool quoted = std::string(argv[3]) == "1";

  std::ofstream f(out, std::ios::binary);
  if (!f){ std::cerr << "open failed: " << out << "\n"; return 2; }

  // header
  f << "customer_id,session_uuid,age,score,active,signup_date,department,comment\n";

  std::mt19937_64 rng(42);
  std::uniform_int_distribution<int> di(18, 90);
  std::normal_distribution<double> df(50.0, 12.5);
  std::uniform_int_distribution<unsigned> dh(0, 15);
  const char* departments[] = {"Engineering","Marketing","Sales","Support"};
  const char* words[] = {"alpha","bravo","charlie","delta","echo","foxtrot"};
  const char* hex = "0123456789abcdef";

  for (std::uint64_t i=1;i<=rows;++i){
    std::string uuid;
    for (int k = 0; k < 32; ++k){
      if (k == 8 || k == 12 || k == 16 || k == 20) uuid += '-';
      uuid += hex[dh(rng)];
    }
    // signup dates spread over five years
    int y = 2020 + int(i % 5), m = 1 + int(i % 12), d = 1 + int(i % 28);
    char datebuf[32];
    std::snprintf(datebuf, sizeof(datebuf), "%04d-%02d-%02d", y, m, d);
    char scorebuf[32];
    std::snprintf(scorebuf, sizeof(scorebuf), "%.3f", df(rng));

    auto emit = [&](const std::string& x){
      if (!quoted) { f << x; return; }
      // quote & escape inner quotes
      f << '"';
      for (char c: x){ if (c=='"') f << "\"\""; else f << c; }
      f << '"';
    };

    emit(std::to_string(i)); f << ",";
    emit(uuid); f << ",";
    // every 13th age is missing, every 29th score is unreadable
    emit(i % 13 == 0 ? std::string() : std::to_string(di(rng))); f << ",";
    emit(i % 29 == 0 ? std::string("n/a") : std::string(scorebuf)); f << ",";
    emit((i % 4) ? "yes" : "no"); f << ",";
    emit(datebuf); f << ",";
    emit(departments[i % 4]); f << ",";
    std::string s = std::string(words[i % 6]) + " " + std::to_string(i * 7919 % 100003);
    // Add some commas/quotes/newlines occasionally when quoted mode is on
    if (quoted && (i % 17 == 0)) s += ", said \"hi\"\nand left";
    emit(i % 11 == 0 ? std::string("NA") : s);
    f << "\n";
  }
  std::cerr << "wrote " << rows << " rows to " << out << "\n";
  return 0;
}
