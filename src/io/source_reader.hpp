#pragma once
#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/errors.hpp"
#include "io/chunk_buffer.hpp"
#include "io/file_stats.hpp"
#include "util/log.hpp"

namespace repcat {

enum class cache_policy {
    fully_cached,       // whole file held in memory, replayed for every pass
    streamed_per_pass   // re-read from disk on every pass
};

inline const char* to_string(cache_policy p) {
    return p == cache_policy::fully_cached ? "cached" : "streamed";
}

// Running total of bytes committed to file caches, checked against an
// optional ceiling. Reservations are never released during a run.
class cache_budget {
public:
    cache_budget() = default;
    explicit cache_budget(std::optional<std::uint64_t> limit) : limit_(limit) {}

    bool try_reserve(std::uint64_t bytes) {
        if (limit_ && (bytes > *limit_ || committed_ > *limit_ - bytes)) return false;
        committed_ += bytes;
        return true;
    }

    std::uint64_t committed() const { return committed_; }
    const std::optional<std::uint64_t>& limit() const { return limit_; }

private:
    std::optional<std::uint64_t> limit_;
    std::uint64_t committed_ = 0;
};

struct reader_options {
    std::size_t   chunk_capacity  = 4u << 20;
    std::uint64_t cache_threshold = 64u << 20;
    cache_budget* budget          = nullptr;   // optional, not owned
};

class source_reader;

// One pass over a source. next() returns an empty view at end of data.
// Streamed passes fill the caller's buffer; cached passes return views into
// the reader's cache and leave the buffer untouched.
class chunk_stream {
public:
    chunk_stream(chunk_stream&&) = default;
    chunk_stream& operator=(chunk_stream&&) = default;

    chunk_view next(chunk_buffer& scratch);

    std::uint64_t offset() const { return offset_; }

private:
    friend class source_reader;
    explicit chunk_stream(const source_reader* src) : src_(src) {}

    const source_reader* src_;
    std::uint64_t offset_ = 0;
    std::ifstream in_;   // streamed passes only
};

class source_reader {
public:
    // Records the size and decides the cache policy. Throws io_error if the
    // file cannot be stat'ed or opened for reading.
    source_reader(const std::filesystem::path& p, std::size_t index, const reader_options& opt)
        : path_(p), index_(index), chunk_capacity_(opt.chunk_capacity)
    {
        if (chunk_capacity_ == 0) throw config_error("chunk capacity must be > 0");
        size_ = file_size_bytes(path_);

        std::ifstream check(path_, std::ios::binary);
        if (!check) throw io_error("open", path_.string(), 0, errno);

        policy_ = cache_policy::streamed_per_pass;
        if (size_ <= opt.cache_threshold && (!opt.budget || opt.budget->try_reserve(size_)))
            policy_ = cache_policy::fully_cached;

        log_info("input #{} {} ({} bytes): {}", index_, path_.string(), size_, to_string(policy_));
    }

    source_reader(const source_reader&) = delete;
    source_reader& operator=(const source_reader&) = delete;

    // Restartable: every call yields the same bytes from offset 0.
    // The first call on a cached source loads the whole file.
    chunk_stream produce_chunks(std::uint64_t /*pass_index*/) {
        chunk_stream s(this);
        switch (policy_) {
            case cache_policy::fully_cached:
                if (!cache_loaded_) load_cache();
                break;
            case cache_policy::streamed_per_pass:
                s.in_.open(path_, std::ios::binary);
                if (!s.in_) throw io_error("open", path_.string(), 0, errno);
                ++disk_passes_;
                break;
        }
        return s;
    }

    const std::filesystem::path& path() const { return path_; }
    std::size_t index() const { return index_; }
    std::uint64_t size() const { return size_; }
    std::size_t chunk_capacity() const { return chunk_capacity_; }
    cache_policy policy() const { return policy_; }

    // Bytes currently held in memory by the cache; 0 for streamed sources.
    std::size_t cached_bytes() const { return cache_.size(); }
    // Number of passes that went to disk, including the cache load.
    std::uint64_t disk_passes() const { return disk_passes_; }

private:
    friend class chunk_stream;

    void load_cache() {
        std::ifstream in(path_, std::ios::binary);
        if (!in) throw io_error("open", path_.string(), 0, errno);

        cache_.resize(static_cast<std::size_t>(size_));
        std::uint64_t off = 0;
        while (off < size_) {
            const auto want = static_cast<std::streamsize>(
                std::min<std::uint64_t>(chunk_capacity_, size_ - off));
            in.read(cache_.data() + off, want);
            const auto got = static_cast<std::uint64_t>(in.gcount());
            off += got;
            if (got < static_cast<std::uint64_t>(want)) {
                cache_.clear();
                cache_.shrink_to_fit();
                throw_short_read(in, off);
            }
        }
        cache_loaded_ = true;
        ++disk_passes_;
    }

    [[noreturn]] void throw_short_read(const std::ifstream& in, std::uint64_t off) const {
        if (in.bad()) throw io_error("read", path_.string(), off, errno);
        throw io_error("read", path_.string(), off, 0,
                       "unexpected end of file (expected " + std::to_string(size_) + " bytes)");
    }

    std::filesystem::path path_;
    std::size_t index_ = 0;
    std::uint64_t size_ = 0;
    std::size_t chunk_capacity_ = 0;
    cache_policy policy_ = cache_policy::streamed_per_pass;

    std::vector<char> cache_;
    bool cache_loaded_ = false;
    std::uint64_t disk_passes_ = 0;
};

inline chunk_view chunk_stream::next(chunk_buffer& scratch) {
    const std::uint64_t size = src_->size_;
    if (offset_ >= size) return {};

    const std::size_t cap = src_->chunk_capacity_;
    switch (src_->policy_) {
        case cache_policy::fully_cached: {
            const auto n = static_cast<std::size_t>(std::min<std::uint64_t>(cap, size - offset_));
            chunk_view v{src_->cache_.data() + offset_, n};
            offset_ += n;
            return v;
        }
        case cache_policy::streamed_per_pass: {
            const auto want = static_cast<std::size_t>(
                std::min<std::uint64_t>(std::min(cap, scratch.capacity()), size - offset_));
            in_.read(scratch.data(), static_cast<std::streamsize>(want));
            const auto got = static_cast<std::size_t>(in_.gcount());
            if (got < want) src_->throw_short_read(in_, offset_ + got);
            scratch.set_size(got);
            offset_ += got;
            if (offset_ == size) in_.close();
            return scratch.view();
        }
    }
    throw std::logic_error("unknown cache_policy");
}

}
