#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace blip {

// Consumer of encoded PCM bytes. write() returning false means the consumer
// has gone away; the caller stops producing and treats it as a clean shutdown.
class SampleSink {
public:
    virtual ~SampleSink() = default;
    virtual bool write(const uint8_t* data, size_t size) = 0;
};

// Collects bytes in memory. With a capacity set, the first write that would
// exceed it is dropped and the sink stays closed from then on.
class MemorySink : public SampleSink {
public:
    MemorySink() = default;
    explicit MemorySink(size_t capacity);

    bool write(const uint8_t* data, size_t size) override;

    const std::vector<uint8_t>& bytes() const { return bytes_; }
    size_t write_calls() const { return write_calls_; }
    bool closed() const { return closed_; }
    void clear();

private:
    std::vector<uint8_t> bytes_;
    size_t capacity_ = 0;  // 0 = unbounded
    size_t write_calls_ = 0;
    bool closed_ = false;
};

}  // namespace blip
