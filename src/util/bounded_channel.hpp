#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace repcat {

// Blocking FIFO with a fixed capacity. After close(), push() fails and
// pop() drains what is left, then returns nullopt.
template <typename T>
class bounded_channel {
public:
    explicit bounded_channel(std::size_t capacity) : capacity_(capacity ? capacity : 1) {}

    bool push(T v) {
        std::unique_lock<std::mutex> lk(mtx_);
        has_space_.wait(lk, [this] { return closed_ || items_.size() < capacity_; });
        if (closed_) return false;
        items_.push_back(std::move(v));
        lk.unlock();
        has_data_.notify_one();
        return true;
    }

    std::optional<T> pop() {
        std::unique_lock<std::mutex> lk(mtx_);
        has_data_.wait(lk, [this] { return closed_ || !items_.empty(); });
        if (items_.empty()) return std::nullopt;
        T v = std::move(items_.front());
        items_.pop_front();
        lk.unlock();
        has_space_.notify_one();
        return v;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            closed_ = true;
        }
        has_data_.notify_all();
        has_space_.notify_all();
    }

    std::size_t capacity() const { return capacity_; }

private:
    const std::size_t capacity_;
    std::mutex mtx_;
    std::condition_variable has_space_;
    std::condition_variable has_data_;
    std::deque<T> items_;
    bool closed_ = false;
};

}
