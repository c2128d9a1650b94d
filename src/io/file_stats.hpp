#pragma once
#include <cerrno>
#include <cstdint>
#include <filesystem>
#include <system_error>

#include <unistd.h>

#include "core/errors.hpp"

namespace repcat {

inline std::uintmax_t file_size_bytes(const std::filesystem::path& p) {
    std::error_code ec;
    auto sz = std::filesystem::file_size(p, ec);
    if (ec) throw io_error("stat", p.string(), 0, ec.value());
    return static_cast<std::uintmax_t>(sz);
}

// Regular file the current user may open for reading.
inline bool is_readable_file(const std::filesystem::path& p) {
    std::error_code ec;
    return std::filesystem::is_regular_file(p, ec) && !ec && ::access(p.c_str(), R_OK) == 0;
}

}
