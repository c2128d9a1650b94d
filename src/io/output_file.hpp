#pragma once
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <unistd.h>

#include "core/errors.hpp"
#include "util/log.hpp"

namespace repcat {

// Exclusive writer for the output stream. Either owns a descriptor opened
// by create() or borrows stdout; borrowed descriptors are never closed.
class output_file {
public:
    output_file() = default;

    static output_file create(const std::filesystem::path& p) {
        int fd = ::open(p.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (fd < 0) throw io_error("create", p.string(), 0, errno);
        return output_file(fd, p.string(), true);
    }

    static output_file standard_output() {
        return output_file(STDOUT_FILENO, "<stdout>", false);
    }

    // Takes ownership of an already-open descriptor (pipe, socket, ...).
    static output_file adopt(int fd, std::string name) {
        if (fd < 0) throw io_error("adopt", name, 0, EBADF);
        return output_file(fd, std::move(name), true);
    }

    output_file(output_file&& o) noexcept
        : fd_(std::exchange(o.fd_, -1)), name_(std::move(o.name_)),
          owned_(o.owned_), offset_(o.offset_) {}

    output_file& operator=(output_file&& o) noexcept {
        if (this != &o) {
            release();
            fd_ = std::exchange(o.fd_, -1);
            name_ = std::move(o.name_);
            owned_ = o.owned_;
            offset_ = o.offset_;
        }
        return *this;
    }

    output_file(const output_file&) = delete;
    output_file& operator=(const output_file&) = delete;

    // Error-path close; close() is the checked one.
    ~output_file() { release(); }

    // Writes all n bytes. Short writes and EINTR resume from the partial
    // offset; EAGAIN waits for POLLOUT first. Anything else is an io_error
    // at the failing offset.
    void write_all(const char* data, std::size_t n) {
        std::size_t pos = 0;
        while (pos != n) {
            ssize_t nw = ::write(fd_, data + pos, n - pos);
            if (nw < 0) {
                if (errno == EINTR) continue;
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    wait_writable(offset_ + pos);
                    continue;
                }
                throw io_error("write", name_, offset_ + pos, errno);
            }
            if (nw == 0) throw io_error("write", name_, offset_ + pos, EIO);
            pos += static_cast<std::size_t>(nw);
        }
        offset_ += n;
    }

    // Sizes a regular output file up front. Returns false (and leaves the
    // file alone) for pipes, terminals and other non-regular outputs.
    bool preallocate(std::uint64_t total) {
        struct stat st{};
        if (::fstat(fd_, &st) != 0) throw io_error("stat", name_, offset_, errno);
        if (!S_ISREG(st.st_mode)) return false;
        if (::ftruncate(fd_, static_cast<off_t>(total)) != 0)
            throw io_error("preallocate", name_, total, errno);
        return true;
    }

    void close() {
        if (fd_ < 0) return;
        int fd = std::exchange(fd_, -1);
        if (!owned_) return;
        if (::close(fd) != 0) throw io_error("close", name_, offset_, errno);
    }

    bool is_open() const { return fd_ >= 0; }
    int fd() const { return fd_; }
    const std::string& name() const { return name_; }
    std::uint64_t offset() const { return offset_; }

private:
    output_file(int fd, std::string name, bool owned)
        : fd_(fd), name_(std::move(name)), owned_(owned) {}

    void wait_writable(std::uint64_t at) {
        pollfd pfd{fd_, POLLOUT, 0};
        while (::poll(&pfd, 1, -1) < 0) {
            if (errno != EINTR) throw io_error("poll", name_, at, errno);
        }
    }

    void release() noexcept {
        if (fd_ >= 0 && owned_ && ::close(fd_) != 0)
            log_warn("close failed on {} during cleanup (errno {})", name_, errno);
        fd_ = -1;
    }

    int fd_ = -1;
    std::string name_;
    bool owned_ = false;
    std::uint64_t offset_ = 0;
};

}
