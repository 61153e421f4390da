#include "blip/thread_set.h"

#include <algorithm>

namespace blip {

ThreadId ThreadSet::spawn(size_t pc, const DecisionSource& decisions) {
    ThreadId id = 0;
    if (!free_.empty()) {
        id = free_.back();
        free_.pop_back();
    } else {
        id = static_cast<ThreadId>(slots_.size());
        slots_.emplace_back();
    }

    VirtualThread& t = slots_[id];
    t = VirtualThread{};
    t.pc = pc;
    t.status = ThreadStatus::kReady;
    t.decisions = decisions;

    order_.push_back(id);
    ++live_;
    return id;
}

void ThreadSet::halt(ThreadId id) {
    VirtualThread& t = slots_[id];
    if (t.status == ThreadStatus::kHalted) {
        return;
    }
    t.status = ThreadStatus::kHalted;
    pending_free_.push_back(id);
    --live_;
}

void ThreadSet::compact() {
    if (pending_free_.empty()) {
        return;
    }
    order_.erase(std::remove_if(order_.begin(), order_.end(),
                                [this](ThreadId id) { return slots_[id].status == ThreadStatus::kHalted; }),
                 order_.end());
    free_.insert(free_.end(), pending_free_.begin(), pending_free_.end());
    pending_free_.clear();
}

void ThreadSet::clear() {
    slots_.clear();
    free_.clear();
    order_.clear();
    pending_free_.clear();
    live_ = 0;
}

}  // namespace blip
