#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "blip/decision_source.h"

namespace blip {

using ThreadId = uint32_t;

enum class ThreadStatus {
    kReady,
    kPlaying,
    kHalted,
};

// One virtual thread of control. Not an OS thread.
struct VirtualThread {
    size_t pc = 0;
    ThreadStatus status = ThreadStatus::kReady;
    DecisionSource decisions;

    // Valid while kPlaying.
    double phase = 0.0;
    double phase_step = 0.0;
    uint64_t samples_remaining = 0;
};

// Arena of thread records addressed by stable small ids. Spawning appends to
// the traversal order; removal only frees the slot, so ids held during a pass
// stay valid until compact() runs.
class ThreadSet {
public:
    ThreadId spawn(size_t pc, const DecisionSource& decisions);
    void halt(ThreadId id);

    // Drop halted ids from the traversal order and recycle their slots.
    void compact();
    void clear();

    VirtualThread& get(ThreadId id) { return slots_[id]; }
    const VirtualThread& get(ThreadId id) const { return slots_[id]; }

    // Live ids (plus ids halted since the last compact()) in spawn order.
    const std::vector<ThreadId>& order() const { return order_; }

    size_t live_count() const { return live_; }
    bool empty() const { return live_ == 0; }
    size_t capacity() const { return slots_.size(); }

private:
    std::vector<VirtualThread> slots_;
    std::vector<ThreadId> free_;
    std::vector<ThreadId> order_;
    std::vector<ThreadId> pending_free_;
    size_t live_ = 0;
};

}  // namespace blip
