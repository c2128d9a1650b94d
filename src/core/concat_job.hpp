#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/progress.hpp"
#include "core/repeat_plan.hpp"
#include "core/write_engine.hpp"
#include "io/file_stats.hpp"
#include "io/output_file.hpp"
#include "io/source_reader.hpp"
#include "util/log.hpp"

namespace repcat {

enum class job_state { idle, running, completed, failed };

inline const char* to_string(job_state s) {
    switch (s) {
        case job_state::idle:      return "idle";
        case job_state::running:   return "running";
        case job_state::completed: return "completed";
        case job_state::failed:    return "failed";
    }
    return "?";
}

struct job_result {
    std::uint64_t bytes_written = 0;
    std::uint64_t bytes_total = 0;
    std::uint64_t tasks = 0;
    std::size_t   inputs = 0;
    std::size_t   cached_files = 0;
    std::size_t   streamed_files = 0;
    std::uint64_t cache_bytes = 0;
    bool          preallocated = false;
};

// Drives one run: plan -> reader -> write engine -> progress.
//
// Configuration is checked in the constructor, so a bad repeat count never
// reaches the output opener. On failure the job moves to `failed`, closes
// what it opened and rethrows; the output is left as far as it got.
class concat_job {
public:
    using output_opener = std::function<output_file()>;

    concat_job(std::vector<std::filesystem::path> inputs, concat_config cfg)
        : inputs_(std::move(inputs)), cfg_(std::move(cfg)),
          plan_(inputs_.size(), cfg_.outer_repeat, cfg_.per_file_repeat, cfg_.per_file_overrides),
          budget_(cfg_.max_cache_bytes)
    {
        cfg_.validate();
    }

    job_result run(const output_opener& open_output, progress_sink& sink) {
        if (state_ != job_state::idle)
            throw std::logic_error(std::string("concat_job::run in state ") + to_string(state_));
        state_ = job_state::running;
        try {
            return run_tasks(open_output, sink);
        } catch (...) {
            state_ = job_state::failed;
            readers_.clear();
            throw;
        }
    }

    job_state state() const { return state_; }
    std::uint64_t bytes_written() const { return bytes_written_; }
    std::uint64_t bytes_total() const { return bytes_total_; }
    const repeat_plan& plan() const { return plan_; }
    const concat_config& config() const { return cfg_; }

private:
    job_result run_tasks(const output_opener& open_output, progress_sink& sink) {
        // Sizes as declared now; each reader re-checks them when opened.
        declared_sizes_.reserve(inputs_.size());
        std::uint64_t per_round = 0;
        for (std::size_t i = 0; i < inputs_.size(); ++i) {
            const std::uint64_t sz = file_size_bytes(inputs_[i]);
            declared_sizes_.push_back(sz);
            per_round = checked_add(per_round, checked_mul(sz, plan_.repeat_for(i)));
        }
        bytes_total_ = checked_mul(per_round, plan_.outer_repeat());
        bytes_written_ = 0;
        readers_.resize(inputs_.size());

        log_info("{} inputs, {} tasks, {} bytes total", inputs_.size(), plan_.task_count(), bytes_total_);

        output_file out = open_output();
        job_result res;
        if (cfg_.preallocate) {
            res.preallocated = out.preallocate(bytes_total_);
            if (!res.preallocated) log_warn("{} is not a regular file; not preallocating", out.name());
        }

        write_engine engine(cfg_.chunk_capacity, cfg_.pipelined);
        std::uint64_t last_reported = 0;
        auto on_chunk = [&](std::size_t n) {
            bytes_written_ += n;
            if (bytes_written_ - last_reported >= cfg_.progress_interval_bytes) {
                last_reported = bytes_written_;
                sink.update(bytes_written_, bytes_total_);
            }
        };

        auto cursor = plan_.produce_tasks();
        while (auto t = cursor.next()) {
            source_reader& src = reader_for(t->file_index);
            const std::uint64_t n = engine.write_task(*t, src, out, on_chunk);
            if (n != src.size())
                throw io_error("read", src.path().string(), n, 0,
                               "pass produced " + std::to_string(n) + " of " +
                               std::to_string(src.size()) + " bytes");
            ++res.tasks;
        }

        out.close();
        state_ = job_state::completed;

        sink.update(bytes_written_, bytes_total_);
        sink.finish(bytes_written_, bytes_total_);

        res.bytes_written = bytes_written_;
        res.bytes_total = bytes_total_;
        res.inputs = inputs_.size();
        res.cache_bytes = budget_.committed();
        for (const auto& r : readers_) {
            if (!r) continue;
            if (r->policy() == cache_policy::fully_cached) ++res.cached_files;
            else ++res.streamed_files;
        }
        readers_.clear();
        return res;
    }

    // Opened on first use, kept until the run ends.
    source_reader& reader_for(std::size_t idx) {
        auto& slot = readers_[idx];
        if (!slot) {
            reader_options opt;
            opt.chunk_capacity = cfg_.chunk_capacity;
            opt.cache_threshold = cfg_.cache_threshold;
            opt.budget = &budget_;
            slot = std::make_unique<source_reader>(inputs_[idx], idx, opt);
            if (slot->size() != declared_sizes_[idx])
                throw io_error("open", inputs_[idx].string(), 0, 0,
                               "size changed from " + std::to_string(declared_sizes_[idx]) +
                               " to " + std::to_string(slot->size()) + " bytes");
        }
        return *slot;
    }

    std::vector<std::filesystem::path> inputs_;
    concat_config cfg_;
    repeat_plan plan_;
    cache_budget budget_;

    job_state state_ = job_state::idle;
    std::vector<std::uint64_t> declared_sizes_;
    std::vector<std::unique_ptr<source_reader>> readers_;
    std::uint64_t bytes_written_ = 0;
    std::uint64_t bytes_total_ = 0;
};

}
