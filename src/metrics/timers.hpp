#pragma once
#include <chrono>
#include <cstdint>

namespace repcat {

struct WallTimer {
    using clock = std::chrono::steady_clock;
    clock::time_point t0, t1;
    void start() { t0 = clock::now(); }
    void stop()  { t1 = clock::now(); }
    double ms() const { return std::chrono::duration<double,std::milli>(t1 - t0).count(); }
    // Elapsed since start() without stopping.
    double elapsed_ms() const { return std::chrono::duration<double,std::milli>(clock::now() - t0).count(); }
};

inline double mb_per_sec(std::uint64_t bytes, double ms) {
    const double secs = ms / 1000.0;
    return secs > 0.0 ? (static_cast<double>(bytes) / (1024.0 * 1024.0)) / secs : 0.0;
}

}
