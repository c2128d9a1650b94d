#pragma once
#include <CLI/CLI.hpp>
#include <cstddef>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <optional>
#include <string>
#include <vector>

#include "core/config.hpp"

namespace repcat {

struct AppOptions {
    // Inputs/outputs
    std::vector<std::string> files;
    std::string output;                 // empty = stdout
    bool        stdin_input_list = false;

    // Repetition
    std::int64_t repeat_each = 1;
    std::int64_t repeat_all  = 1;
    std::map<std::size_t, std::int64_t> repeat_file;   // --repeat-file INDEX=N

    // Perf / memory
    std::optional<std::int64_t> chunk_bytes;        // unset: env or built-in default
    std::optional<std::int64_t> cache_threshold;
    std::optional<std::int64_t> max_mem_usage;
    bool threaded    = false;
    bool preallocate = false;

    // Reporting
    bool        no_progress = false;
    std::string stats_json;
    bool        verbose = false;
};

// Thrown by parse_cli once CLI11 has printed help, version or a usage error.
struct cli_exit {
    int code = 0;
};

// Parses "INDEX=N" into the override map.
inline void parse_repeat_file(const std::vector<std::string>& specs,
                              std::map<std::size_t, std::int64_t>& out) {
    for (const auto& s : specs) {
        const auto eq = s.find('=');
        if (eq == std::string::npos || eq == 0 || eq + 1 == s.size())
            throw CLI::ValidationError{"repeat-file", "expected INDEX=N, got '" + s + "'"};
        try {
            std::size_t used = 0;
            const std::string idx_str = s.substr(0, eq);
            const std::string n_str = s.substr(eq + 1);
            if (idx_str[0] == '-')
                throw CLI::ValidationError{"repeat-file", "file index must be >= 0 in '" + s + "'"};
            const auto idx = static_cast<std::size_t>(std::stoull(idx_str, &used));
            if (used != idx_str.size()) throw std::invalid_argument(idx_str);
            const std::int64_t n = std::stoll(n_str, &used);
            if (used != n_str.size()) throw std::invalid_argument(n_str);
            out[idx] = n;
        } catch (const std::logic_error&) {
            throw CLI::ValidationError{"repeat-file", "expected INDEX=N, got '" + s + "'"};
        }
    }
}

inline AppOptions parse_cli(int argc, char** argv) {
    AppOptions opt;
    CLI::App app{"repcat: concatenate files, repeated, at disk speed"};
    app.set_version_flag("--version", "0.1.0");

    app.add_option("files", opt.files, "Input files, in output order");
    app.add_option("-o,--output", opt.output, "Output file (default: stdout)");
    app.add_flag("-s,--stdin-input-list", opt.stdin_input_list,
                 "Read more input paths from stdin, one per line (after the positional ones)");

    app.add_option("-r,--repeat-each", opt.repeat_each, "Times to repeat each input file")
        ->default_val(1);
    app.add_option("--repeat-all", opt.repeat_all, "Times to repeat the whole input list")
        ->default_val(1);
    std::vector<std::string> repeat_file_specs;
    app.add_option("--repeat-file", repeat_file_specs,
                   "Per-file repeat count as INDEX=N (0-based, repeatable)");

    app.add_option("--chunk-bytes", opt.chunk_bytes, "Chunk size (bytes)");
    app.add_option("--cache-threshold", opt.cache_threshold,
                   "Files up to this size (bytes) are read once and replayed from memory");
    app.add_option("-m,--max-mem-usage", opt.max_mem_usage,
                   "Upper bound (bytes) on memory used for cached file contents");
    app.add_flag("-j,--threaded", opt.threaded, "Read and write on separate threads");
    app.add_flag("--preallocate", opt.preallocate, "Size the output file before writing");

    app.add_flag("--no-progress", opt.no_progress, "Disable the progress bar");
    app.add_option("--stats-json", opt.stats_json, "Write a run summary JSON to this path");
    app.add_flag("-v,--verbose", opt.verbose, "Log cache decisions and a throughput summary");

    try {
        app.parse(argc, argv);

        // --- Validation ---
        parse_repeat_file(repeat_file_specs, opt.repeat_file);

        auto positive = [](const std::optional<std::int64_t>& v, const char* name) {
            if (v && *v <= 0) throw CLI::ValidationError{name, "must be > 0"};
        };
        positive(opt.chunk_bytes, "chunk-bytes");
        positive(opt.max_mem_usage, "max-mem-usage");
        if (opt.cache_threshold && *opt.cache_threshold < 0)
            throw CLI::ValidationError{"cache-threshold", "must be >= 0"};

        if (opt.files.empty() && !opt.stdin_input_list)
            throw CLI::ValidationError{"files", "at least one input file is required"};
    } catch (const CLI::ParseError& e) {
        throw cli_exit{app.exit(e) == 0 ? 0 : 1};
    }

    return opt;
}

// Builds the core configuration: built-in defaults, then REPCAT_* environment
// values, then command-line values. Repeat counts are passed through as given
// and rejected by the core if not positive.
inline concat_config make_config(const AppOptions& opt) {
    concat_config cfg = config_from_env();
    cfg.outer_repeat = opt.repeat_all;
    cfg.per_file_repeat = opt.repeat_each;
    cfg.per_file_overrides = opt.repeat_file;
    if (opt.chunk_bytes) cfg.chunk_capacity = static_cast<std::size_t>(*opt.chunk_bytes);
    if (opt.cache_threshold) cfg.cache_threshold = static_cast<std::uint64_t>(*opt.cache_threshold);
    if (opt.max_mem_usage) cfg.max_cache_bytes = static_cast<std::uint64_t>(*opt.max_mem_usage);
    cfg.pipelined = opt.threaded;
    cfg.preallocate = opt.preallocate;
    return cfg;
}

}
