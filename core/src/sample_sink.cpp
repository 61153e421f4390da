#include "blip/sample_sink.h"

namespace blip {

MemorySink::MemorySink(size_t capacity)
    : capacity_(capacity) {}

bool MemorySink::write(const uint8_t* data, size_t size) {
    ++write_calls_;
    if (closed_) {
        return false;
    }
    if (capacity_ > 0 && bytes_.size() + size > capacity_) {
        closed_ = true;
        return false;
    }
    bytes_.insert(bytes_.end(), data, data + size);
    return true;
}

void MemorySink::clear() {
    bytes_.clear();
    write_calls_ = 0;
    closed_ = false;
}

}  // namespace blip
