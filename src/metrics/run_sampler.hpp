#pragma once
#include <cstdint>
#include <vector>

#include "core/progress.hpp"
#include "metrics/process_stats.hpp"
#include "metrics/timers.hpp"

namespace repcat {

struct RunSample {
    std::uint64_t ts_ms = 0;
    std::uint64_t bytes_out = 0;
    double rss_mb = 0.0;
};

// Progress sink decorator: keeps a timeline sample every `interval_ms` and
// forwards every update to the wrapped sink.
class run_sampler final : public progress_sink {
public:
    run_sampler(progress_sink& inner, std::uint64_t interval_ms = 250)
        : inner_(inner), interval_ms_(interval_ms) { clock_.start(); }

    void update(std::uint64_t written, std::uint64_t total) override {
        const auto now = static_cast<std::uint64_t>(clock_.elapsed_ms());
        if (samples_.empty() || now - samples_.back().ts_ms >= interval_ms_)
            samples_.push_back(RunSample{now, written, process_rss_mb()});
        inner_.update(written, total);
    }

    void finish(std::uint64_t written, std::uint64_t total) override {
        const auto now = static_cast<std::uint64_t>(clock_.elapsed_ms());
        if (samples_.empty() || samples_.back().bytes_out != written)
            samples_.push_back(RunSample{now, written, process_rss_mb()});
        inner_.finish(written, total);
    }

    const std::vector<RunSample>& samples() const { return samples_; }

private:
    progress_sink& inner_;
    std::uint64_t interval_ms_;
    WallTimer clock_;
    std::vector<RunSample> samples_;
};

}
