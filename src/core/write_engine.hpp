#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <thread>

#include "core/repeat_plan.hpp"
#include "io/chunk_buffer.hpp"
#include "io/output_file.hpp"
#include "io/source_reader.hpp"
#include "util/bounded_channel.hpp"

namespace repcat {

// Streams the chunks of one task into the output. Owns the two buffer slots
// and reuses them for every task.
//
// Sequential mode alternates the slots on one thread. Pipelined mode runs the
// disk reads of a streamed source on a second thread: it fills one slot while
// this thread writes the other, with both slots passed through capacity-2
// channels. Cached sources have no disk reads to overlap and always take the
// sequential path.
class write_engine {
public:
    using chunk_callback = std::function<void(std::size_t)>;

    write_engine(std::size_t chunk_capacity, bool pipelined)
        : slots_{chunk_buffer(chunk_capacity), chunk_buffer(chunk_capacity)},
          pipelined_(pipelined) {}

    // Returns the bytes written for this task. on_chunk is invoked after
    // each chunk reaches the output, on the calling thread.
    std::uint64_t write_task(const task& t, source_reader& src, output_file& out,
                             const chunk_callback& on_chunk = {}) {
        chunk_stream stream = src.produce_chunks(t.pass);
        if (pipelined_ && src.policy() == cache_policy::streamed_per_pass)
            return write_pipelined(stream, out, on_chunk);
        return write_sequential(stream, out, on_chunk);
    }

    bool pipelined() const { return pipelined_; }
    std::size_t chunk_capacity() const { return slots_[0].capacity(); }

private:
    std::uint64_t write_sequential(chunk_stream& stream, output_file& out,
                                   const chunk_callback& on_chunk) {
        std::uint64_t written = 0;
        std::size_t active = 0;
        for (;;) {
            const chunk_view v = stream.next(slots_[active]);
            if (v.empty()) break;
            out.write_all(v.data, v.size);
            written += v.size;
            if (on_chunk) on_chunk(v.size);
            active ^= 1u;
        }
        return written;
    }

    struct filled_slot {
        std::size_t slot;
        chunk_view view;
    };

    std::uint64_t write_pipelined(chunk_stream& stream, output_file& out,
                                  const chunk_callback& on_chunk) {
        bounded_channel<std::size_t> free_slots(slots_.size());
        bounded_channel<filled_slot> full(slots_.size());
        free_slots.push(0);
        free_slots.push(1);

        std::exception_ptr read_error;
        std::thread reader([&] {
            try {
                while (auto slot = free_slots.pop()) {
                    const chunk_view v = stream.next(slots_[*slot]);
                    if (v.empty()) break;
                    if (!full.push(filled_slot{*slot, v})) break;
                }
            } catch (...) {
                read_error = std::current_exception();
            }
            full.close();
        });

        std::uint64_t written = 0;
        try {
            while (auto f = full.pop()) {
                out.write_all(f->view.data, f->view.size);
                written += f->view.size;
                if (on_chunk) on_chunk(f->view.size);
                free_slots.push(f->slot);
            }
        } catch (...) {
            free_slots.close();
            full.close();
            reader.join();
            throw;
        }
        reader.join();
        if (read_error) std::rethrow_exception(read_error);
        return written;
    }

    std::array<chunk_buffer, 2> slots_;
    bool pipelined_ = false;
};

}
