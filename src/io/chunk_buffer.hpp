#pragma once
#include <cstddef>
#include <stdexcept>
#include <vector>

namespace repcat {

// Read-only window over bytes owned elsewhere (a chunk_buffer or a file cache).
struct chunk_view {
    const char* data = nullptr;
    std::size_t size = 0;

    bool empty() const { return size == 0; }
};

// Fixed-capacity byte buffer with a filled length. Allocated once and
// reused for every chunk of every task.
class chunk_buffer {
public:
    explicit chunk_buffer(std::size_t capacity) : buf_(capacity) {
        if (capacity == 0) throw std::invalid_argument("chunk_buffer capacity == 0");
    }

    char* data() { return buf_.data(); }
    const char* data() const { return buf_.data(); }

    std::size_t capacity() const { return buf_.size(); }
    std::size_t size() const { return filled_; }
    bool empty() const { return filled_ == 0; }

    void set_size(std::size_t n) {
        if (n > buf_.size()) throw std::out_of_range("chunk_buffer fill exceeds capacity");
        filled_ = n;
    }
    void clear() { filled_ = 0; }

    chunk_view view() const { return chunk_view{buf_.data(), filled_}; }

private:
    std::vector<char> buf_;
    std::size_t filled_ = 0;
};

}
