// src/util/log.hpp
#pragma once
#include <fmt/format.h>
#include <cstdio>
#include <string_view>
#include <utility>

namespace repcat {

enum class log_level { error = 0, warn = 1, info = 2 };

// Process-wide threshold; the CLI raises it to info with --verbose.
inline log_level& log_threshold() {
    static log_level level = log_level::warn;
    return level;
}

inline bool log_enabled(log_level lvl) {
    return static_cast<int>(lvl) <= static_cast<int>(log_threshold());
}

template <typename... Args>
void log_error(std::string_view fmt_str, Args&&... args) {
    fmt::print(stderr, "ERROR: {}\n", fmt::format(fmt::runtime(fmt_str), std::forward<Args>(args)...));
}

template <typename... Args>
void log_warn(std::string_view fmt_str, Args&&... args) {
    if (!log_enabled(log_level::warn)) return;
    fmt::print(stderr, "WARN: {}\n", fmt::format(fmt::runtime(fmt_str), std::forward<Args>(args)...));
}

template <typename... Args>
void log_info(std::string_view fmt_str, Args&&... args) {
    if (!log_enabled(log_level::info)) return;
    fmt::print(stderr, "INFO: {}\n", fmt::format(fmt::runtime(fmt_str), std::forward<Args>(args)...));
}

}
