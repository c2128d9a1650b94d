#pragma once
#include <fmt/format.h>
#include <cerrno>
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

#include "core/concat_job.hpp"
#include "core/errors.hpp"
#include "metrics/run_sampler.hpp"
#include "metrics/timers.hpp"
#include "util/json_escape.hpp"

namespace repcat {

struct RunSummary {
    std::string started_iso;
    std::string ended_iso;
    double wall_ms = 0.0;
    std::string output;
    std::vector<std::string> inputs;
    job_result result;
    std::int64_t repeat_all = 1;
    std::int64_t repeat_each = 1;
    std::size_t chunk_bytes = 0;
    std::uint64_t cache_threshold = 0;
    bool pipelined = false;
    double rss_peak_mb = 0.0;
};

// Writes run.json (schema v1).
inline void emit_run_json(const std::string& out_path,
                          const RunSummary& run,
                          const std::vector<RunSample>& samples)
{
    std::ofstream f(out_path, std::ios::binary);
    if (!f) throw io_error("create", out_path, 0, errno);

    const auto& r = run.result;
    f << "{\n";
    f << R"(  "version":"1",)"
      << "\n  " << fmt::format(R"("started_at":"{}",)", run.started_iso)
      << "\n  " << fmt::format(R"("ended_at":"{}",)", run.ended_iso)
      << "\n  " << fmt::format(R"("wall_time_ms":{},)", run.wall_ms)
      << "\n  " << fmt::format(R"("output":"{}",)", json_escape(run.output))
      << "\n  " << fmt::format(R"("repeat_all":{},)", run.repeat_all)
      << "\n  " << fmt::format(R"("repeat_each":{},)", run.repeat_each)
      << "\n  " << fmt::format(R"("chunk_bytes":{},)", run.chunk_bytes)
      << "\n  " << fmt::format(R"("cache_threshold":{},)", run.cache_threshold)
      << "\n  " << fmt::format(R"("pipelined":{},)", run.pipelined ? "true" : "false")
      << "\n  " << fmt::format(R"("tasks":{},)", r.tasks)
      << "\n  " << fmt::format(R"("bytes_total":{},)", r.bytes_total)
      << "\n  " << fmt::format(R"("bytes_written":{},)", r.bytes_written)
      << "\n  " << fmt::format(R"("throughput_output_mb_s":{},)", mb_per_sec(r.bytes_written, run.wall_ms))
      << "\n  " << fmt::format(R"("cached_files":{},)", r.cached_files)
      << "\n  " << fmt::format(R"("streamed_files":{},)", r.streamed_files)
      << "\n  " << fmt::format(R"("cache_bytes":{},)", r.cache_bytes)
      << "\n  " << fmt::format(R"("preallocated":{},)", r.preallocated ? "true" : "false")
      << "\n  " << fmt::format(R"("rss_peak_mb":{},)", run.rss_peak_mb);

    // inputs
    f << "\n  \"inputs\":[\n";
    for (size_t i = 0; i < run.inputs.size(); ++i) {
        f << fmt::format(R"(    "{}")", json_escape(run.inputs[i]));
        if (i + 1 < run.inputs.size()) f << ",";
        f << "\n";
    }
    f << "  ],\n";

    // samples
    f << "  \"samples\":[\n";
    for (size_t i = 0; i < samples.size(); ++i) {
        const auto& s = samples[i];
        f << "    "
          << fmt::format(R"({{"ts_ms":{},"bytes_out":{},"rss_mb":{}}})", s.ts_ms, s.bytes_out, s.rss_mb);
        if (i + 1 < samples.size()) f << ",";
        f << "\n";
    }
    f << "  ]\n";

    f << "}\n";
    f.flush();
    if (!f) throw io_error("write", out_path, 0, errno);
}

}
