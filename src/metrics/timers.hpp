#pragma once
#include <chrono>
#include <cstdint>

namespace tabprof {

struct WallTimer {
    using clock = std::chrono::steady_clock;
    clock::time_point t0, t1;
    void start() { t0 = clock::now(); }
    void stop()  { t1 = clock::now(); }
    double ms() const { return std::chrono::duration<double,std::milli>(t1 - t0).count(); }
    double seconds() const { return std::chrono::duration<double>(t1 - t0).count(); }
};

// Wall-clock now as microseconds since the Unix epoch.
inline std::int64_t now_epoch_us() {
    using namespace std::chrono;
    return duration_cast<microseconds>(system_clock::now().time_since_epoch()).count();
}

}
