#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <system_error>

namespace repcat {

// Invalid repeat counts, empty input list, zero chunk capacity.
// Always raised before any I/O happens.
class config_error : public std::runtime_error {
public:
    explicit config_error(const std::string& what) : std::runtime_error(what) {}
};

// open/read/write/stat failure on a named resource.
// errno_value is 0 when the failure has no OS error behind it
// (e.g. end of file before the size recorded at open).
class io_error : public std::runtime_error {
public:
    io_error(const std::string& op, const std::string& path, std::uint64_t offset, int errno_value = 0)
        : std::runtime_error(format_message(op, path, offset, errno_value)),
          op_(op), path_(path), offset_(offset), errno_(errno_value) {}

    io_error(const std::string& op, const std::string& path, std::uint64_t offset,
             int errno_value, const std::string& detail)
        : std::runtime_error(format_message(op, path, offset, errno_value) + ": " + detail),
          op_(op), path_(path), offset_(offset), errno_(errno_value) {}

    const std::string& operation() const { return op_; }
    const std::string& path() const { return path_; }
    std::uint64_t offset() const { return offset_; }
    int errno_value() const { return errno_; }

private:
    static std::string format_message(const std::string& op, const std::string& path,
                                      std::uint64_t offset, int errno_value) {
        std::string msg = op + " failed: " + path + " at offset " + std::to_string(offset);
        if (errno_value != 0)
            msg += " (" + std::generic_category().message(errno_value) + ")";
        return msg;
    }

    std::string op_;
    std::string path_;
    std::uint64_t offset_ = 0;
    int errno_ = 0;
};

}
