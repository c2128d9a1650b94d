#pragma once
#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>

#include "core/errors.hpp"

namespace repcat {

// One unit of output: pass number `pass` (0-based) over file `file_index`,
// inside outer repetition `outer` (0-based).
struct task {
    std::size_t   file_index = 0;
    std::uint64_t pass = 0;
    std::uint64_t outer = 0;

    bool operator==(const task& o) const {
        return file_index == o.file_index && pass == o.pass && outer == o.outer;
    }
};

// Output sizes and task counts are uint64; a product that does not fit is a
// configuration error, raised before anything is written.
inline std::uint64_t checked_mul(std::uint64_t a, std::uint64_t b) {
    if (a != 0 && b > std::numeric_limits<std::uint64_t>::max() / a)
        throw config_error("repeat counts overflow the output size");
    return a * b;
}

inline std::uint64_t checked_add(std::uint64_t a, std::uint64_t b) {
    if (b > std::numeric_limits<std::uint64_t>::max() - a)
        throw config_error("repeat counts overflow the output size");
    return a + b;
}

class repeat_plan;

// Lazy walk over a plan; holds only the current position.
class task_cursor {
public:
    explicit task_cursor(const repeat_plan& plan) : plan_(&plan) {}

    std::optional<task> next();

private:
    const repeat_plan* plan_;
    std::uint64_t outer_ = 0;
    std::size_t   file_ = 0;
    std::uint64_t pass_ = 0;
};

// Order: for each outer repetition, files in declaration order, each file's
// passes back to back. That order is the byte order of the output.
class repeat_plan {
public:
    repeat_plan(std::size_t file_count,
                std::int64_t outer_repeat,
                std::int64_t per_file_repeat = 1,
                const std::map<std::size_t, std::int64_t>& overrides = {})
        : file_count_(file_count)
    {
        if (file_count == 0) throw config_error("no input files");
        outer_ = checked_count("repeat-all", outer_repeat);
        per_file_ = checked_count("repeat-each", per_file_repeat);
        for (const auto& [idx, n] : overrides) {
            if (idx >= file_count)
                throw config_error("repeat override for file #" + std::to_string(idx) +
                                   " but only " + std::to_string(file_count) + " inputs");
            overrides_[idx] = checked_count("repeat for file #" + std::to_string(idx), n);
        }
        passes_per_round_ = checked_mul(file_count_ - overrides_.size(), per_file_);
        for (const auto& kv : overrides_) passes_per_round_ = checked_add(passes_per_round_, kv.second);
        task_count_ = checked_mul(passes_per_round_, outer_);
    }

    std::size_t file_count() const { return file_count_; }
    std::uint64_t outer_repeat() const { return outer_; }

    std::uint64_t repeat_for(std::size_t file_index) const {
        auto it = overrides_.find(file_index);
        return it == overrides_.end() ? per_file_ : it->second;
    }

    // Number of passes in one outer repetition.
    std::uint64_t passes_per_round() const { return passes_per_round_; }
    std::uint64_t task_count() const { return task_count_; }

    task_cursor produce_tasks() const { return task_cursor(*this); }

private:
    static std::uint64_t checked_count(const std::string& what, std::int64_t n) {
        if (n < 1) throw config_error(what + " must be >= 1 (got " + std::to_string(n) + ")");
        return static_cast<std::uint64_t>(n);
    }

    std::size_t file_count_ = 0;
    std::uint64_t outer_ = 1;
    std::uint64_t per_file_ = 1;
    std::map<std::size_t, std::uint64_t> overrides_;
    std::uint64_t passes_per_round_ = 0;
    std::uint64_t task_count_ = 0;
};

inline std::optional<task> task_cursor::next() {
    while (outer_ < plan_->outer_repeat()) {
        if (file_ == plan_->file_count()) {
            file_ = 0;
            ++outer_;
            continue;
        }
        if (pass_ < plan_->repeat_for(file_)) {
            task t{file_, pass_, outer_};
            ++pass_;
            return t;
        }
        pass_ = 0;
        ++file_;
    }
    return std::nullopt;
}

}
