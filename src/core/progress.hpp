#pragma once
#include <cstdint>

namespace repcat {

// Receives cumulative (bytes_written, bytes_total). Called from the thread
// that runs the job, at most once per chunk.
class progress_sink {
public:
    virtual ~progress_sink() = default;
    virtual void update(std::uint64_t bytes_written, std::uint64_t bytes_total) = 0;
    // Called once after the last update of a successful run.
    virtual void finish(std::uint64_t /*bytes_written*/, std::uint64_t /*bytes_total*/) {}
};

class null_progress final : public progress_sink {
public:
    void update(std::uint64_t, std::uint64_t) override {}
};

}
