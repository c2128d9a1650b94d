#pragma once
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>

#include "core/progress.hpp"
#include "metrics/timers.hpp"

namespace repcat {

inline std::string human_bytes(std::uint64_t b) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double v = static_cast<double>(b);
    int u = 0;
    while (v >= 1024.0 && u < 4) { v /= 1024.0; ++u; }
    return u == 0 ? fmt::format("{} B", b) : fmt::format("{:.1f} {}", v, units[u]);
}

// Single-line bar on stderr, redrawn at most every `min_redraw_ms`.
class terminal_progress final : public progress_sink {
public:
    explicit terminal_progress(std::FILE* out = stderr, double min_redraw_ms = 100.0)
        : out_(out), min_redraw_ms_(min_redraw_ms) { clock_.start(); }

    void update(std::uint64_t written, std::uint64_t total) override {
        const double now = clock_.elapsed_ms();
        if (drawn_ && now - last_draw_ms_ < min_redraw_ms_) return;
        last_draw_ms_ = now;
        draw(written, total, now);
    }

    void finish(std::uint64_t written, std::uint64_t total) override {
        draw(written, total, clock_.elapsed_ms());
        fmt::print(out_, "\n");
        std::fflush(out_);
    }

private:
    void draw(std::uint64_t written, std::uint64_t total, double now_ms) {
        constexpr int width = 30;
        const double frac = total ? std::min(1.0, static_cast<double>(written) / static_cast<double>(total)) : 1.0;
        const int fill = static_cast<int>(frac * width);
        fmt::print(out_, "\r[{}{}] {:5.1f}% {} / {} {:.1f} MB/s   ",
                   std::string(static_cast<std::size_t>(fill), '#'),
                   std::string(static_cast<std::size_t>(width - fill), '.'),
                   frac * 100.0, human_bytes(written), human_bytes(total),
                   mb_per_sec(written, now_ms));
        std::fflush(out_);
        drawn_ = true;
    }

    std::FILE* out_;
    double min_redraw_ms_;
    WallTimer clock_;
    double last_draw_ms_ = 0.0;
    bool drawn_ = false;
};

}
