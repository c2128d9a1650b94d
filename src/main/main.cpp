#include <fmt/format.h>
#include <algorithm>
#include <cerrno>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <unistd.h>

#include "cli/cli_options.hpp"
#include "cli/progress_bar.hpp"
#include "core/concat_job.hpp"
#include "core/errors.hpp"
#include "io/file_stats.hpp"
#include "io/output_file.hpp"
#include "metrics/process_stats.hpp"
#include "metrics/run_sampler.hpp"
#include "metrics/timers.hpp"
#include "report/emit_run_json.hpp"
#include "util/log.hpp"

namespace fs = std::filesystem;
using namespace repcat;

// ---------- small helpers ----------
static std::string now_iso_utc() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf);
}

// Positional inputs first, then (with -s) one path per stdin line.
static std::vector<fs::path> collect_inputs(const AppOptions& opt) {
    std::vector<fs::path> inputs(opt.files.begin(), opt.files.end());
    if (opt.stdin_input_list) {
        std::string line;
        while (std::getline(std::cin, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (!line.empty()) inputs.emplace_back(line);
        }
        if (std::cin.bad()) throw io_error("read", "<stdin>", 0, errno);
    }
    return inputs;
}

int main(int argc, char** argv) try {
    const auto opt = parse_cli(argc, argv);
    if (opt.verbose) log_threshold() = log_level::info;

    const std::vector<fs::path> inputs = collect_inputs(opt);
    for (const auto& p : inputs) {
        if (!is_readable_file(p)) {
            log_error("input not found or not a regular file: {}", p.string());
            return 2; // IO error
        }
    }

    // Validates repeat counts before the output is touched.
    concat_job job(inputs, make_config(opt));

    const bool to_stdout = opt.output.empty();
    if (to_stdout && ::isatty(STDOUT_FILENO))
        log_warn("writing binary output to a terminal");

    null_progress quiet;
    terminal_progress bar;
    const bool show_bar = !opt.no_progress && ::isatty(STDERR_FILENO);
    run_sampler sampler(show_bar ? static_cast<progress_sink&>(bar) : quiet);

    const auto started_iso = now_iso_utc();
    WallTimer wt_all; wt_all.start();

    const job_result res = job.run(
        [&] {
            return to_stdout ? output_file::standard_output()
                             : output_file::create(opt.output);
        },
        sampler);

    wt_all.stop();

    log_info("wrote {} bytes ({} tasks, {} cached / {} streamed inputs) in {:.3f}s, {:.2f} MB/s",
             res.bytes_written, res.tasks, res.cached_files, res.streamed_files,
             wt_all.ms() / 1000.0, mb_per_sec(res.bytes_written, wt_all.ms()));

    if (!opt.stats_json.empty()) {
        RunSummary run;
        run.started_iso = started_iso;
        run.ended_iso = now_iso_utc();
        run.wall_ms = wt_all.ms();
        run.output = to_stdout ? "<stdout>" : opt.output;
        run.inputs.reserve(inputs.size());
        for (const auto& p : inputs) run.inputs.push_back(p.string());
        run.result = res;
        run.repeat_all = job.config().outer_repeat;
        run.repeat_each = job.config().per_file_repeat;
        run.chunk_bytes = job.config().chunk_capacity;
        run.cache_threshold = job.config().cache_threshold;
        run.pipelined = job.config().pipelined;
        run.rss_peak_mb = std::max(process_peak_rss_mb(), process_rss_mb());
        emit_run_json(opt.stats_json, run, sampler.samples());
    }
    return 0;
}
catch (const cli_exit& e) {
    return e.code; // CLI11 already printed help/version/usage error
}
catch (const config_error& e) {
    log_error("{}", e.what());
    return 3;
}
catch (const io_error& e) {
    log_error("{}", e.what());
    return 2;
}
catch (const std::exception& e) {
    log_error("{}", e.what());
    return 4; // internal error
}
