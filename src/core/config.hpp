#pragma once
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <optional>
#include <string>

#include "core/errors.hpp"

namespace repcat {

inline constexpr std::size_t   kDefaultChunkBytes     = 4u << 20;    // 4 MiB
inline constexpr std::uint64_t kDefaultCacheThreshold = 64u << 20;   // 64 MiB
inline constexpr std::uint64_t kDefaultProgressBytes  = 1u << 20;

struct concat_config {
    std::int64_t outer_repeat    = 1;
    std::int64_t per_file_repeat = 1;
    std::map<std::size_t, std::int64_t> per_file_overrides;   // file index -> count

    std::size_t   chunk_capacity  = kDefaultChunkBytes;
    std::uint64_t cache_threshold = kDefaultCacheThreshold;
    std::optional<std::uint64_t> max_cache_bytes;   // total across cached files

    bool pipelined   = false;   // reader thread + writer, two slots in flight
    bool preallocate = false;   // size the output to bytes_total first

    std::uint64_t progress_interval_bytes = kDefaultProgressBytes;

    // Repeat counts are checked by repeat_plan; this covers the rest.
    void validate() const {
        if (chunk_capacity == 0) throw config_error("chunk capacity must be > 0");
        if (outer_repeat < 1)
            throw config_error("repeat-all must be >= 1 (got " + std::to_string(outer_repeat) + ")");
        if (per_file_repeat < 1)
            throw config_error("repeat-each must be >= 1 (got " + std::to_string(per_file_repeat) + ")");
        for (const auto& [idx, n] : per_file_overrides) {
            if (n < 1)
                throw config_error("repeat for file #" + std::to_string(idx) +
                                   " must be >= 1 (got " + std::to_string(n) + ")");
        }
    }
};

// Parses a positive byte count from an environment variable; unset -> nullopt.
inline std::optional<std::uint64_t> env_bytes(const char* name) {
    const char* v = std::getenv(name);
    if (!v || !*v) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    const unsigned long long n = std::strtoull(v, &end, 10);
    if (errno != 0 || *end != '\0' || v[0] == '-' || n == 0)
        throw config_error(std::string(name) + " must be a positive byte count (got '" + v + "')");
    return static_cast<std::uint64_t>(n);
}

// REPCAT_CHUNK_BYTES / REPCAT_CACHE_THRESHOLD override the built-in defaults.
// Command-line values are applied after this and win.
inline concat_config config_from_env(concat_config cfg = {}) {
    if (auto n = env_bytes("REPCAT_CHUNK_BYTES")) cfg.chunk_capacity = static_cast<std::size_t>(*n);
    if (auto n = env_bytes("REPCAT_CACHE_THRESHOLD")) cfg.cache_threshold = *n;
    return cfg;
}

}
