#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace blip {

class ThreadSet;

enum class SampleFormat {
    kU8,     // unsigned 8-bit, silence = 128
    kS16LE,  // signed 16-bit little-endian, silence = 0
};

const char* SampleFormatName(SampleFormat format);
bool ParseSampleFormat(const std::string& name, SampleFormat* out);
size_t BytesPerSample(SampleFormat format);

// Sums unit-amplitude sine contributions and hard-clips the result to
// [-1, 1]. Concurrent tones that exceed full scale distort audibly; there is
// no automatic gain reduction.
class Mixer {
public:
    explicit Mixer(SampleFormat format = SampleFormat::kU8);

    void reset();

    // One output sample from every playing thread's current phase.
    double mix(const ThreadSet& threads);

    // Clip a raw sum and update clip/peak statistics.
    double saturate(double sum);

    void encode(double sample, std::vector<uint8_t>* out) const;

    static uint8_t ToU8(double sample);
    static int16_t ToS16(double sample);

    SampleFormat format() const { return format_; }
    size_t bytes_per_sample() const { return BytesPerSample(format_); }
    uint64_t clipped_samples() const { return clipped_; }
    double peak() const { return peak_; }

private:
    SampleFormat format_;
    uint64_t clipped_ = 0;
    double peak_ = 0.0;
};

}  // namespace blip
