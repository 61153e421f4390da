#include "blip/mixer.h"

#include <algorithm>
#include <cctype>
#include <cmath>

#include "blip/thread_set.h"

namespace blip {

namespace {
constexpr double kU8Scale = 127.0;
constexpr int kU8Center = 128;
constexpr double kS16Scale = 32767.0;
}  // namespace

const char* SampleFormatName(SampleFormat format) {
    switch (format) {
    case SampleFormat::kU8:
        return "u8";
    case SampleFormat::kS16LE:
        return "s16le";
    }
    return "?";
}

bool ParseSampleFormat(const std::string& name, SampleFormat* out) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    SampleFormat f;
    if (n == "u8") {
        f = SampleFormat::kU8;
    } else if (n == "s16le" || n == "s16") {
        f = SampleFormat::kS16LE;
    } else {
        return false;
    }
    if (out) {
        *out = f;
    }
    return true;
}

size_t BytesPerSample(SampleFormat format) {
    return format == SampleFormat::kS16LE ? 2 : 1;
}

Mixer::Mixer(SampleFormat format)
    : format_(format) {}

void Mixer::reset() {
    clipped_ = 0;
    peak_ = 0.0;
}

double Mixer::mix(const ThreadSet& threads) {
    double sum = 0.0;
    for (const ThreadId id : threads.order()) {
        const VirtualThread& t = threads.get(id);
        if (t.status != ThreadStatus::kPlaying) {
            continue;
        }
        sum += std::sin(t.phase);
    }
    return saturate(sum);
}

double Mixer::saturate(double sum) {
    const double mag = std::fabs(sum);
    if (mag > peak_) {
        peak_ = mag;
    }
    if (sum > 1.0) {
        ++clipped_;
        return 1.0;
    }
    if (sum < -1.0) {
        ++clipped_;
        return -1.0;
    }
    return sum;
}

uint8_t Mixer::ToU8(double sample) {
    const double s = std::clamp(sample, -1.0, 1.0);
    return static_cast<uint8_t>(kU8Center + std::lround(s * kU8Scale));
}

int16_t Mixer::ToS16(double sample) {
    const double s = std::clamp(sample, -1.0, 1.0);
    return static_cast<int16_t>(std::lround(s * kS16Scale));
}

void Mixer::encode(double sample, std::vector<uint8_t>* out) const {
    if (format_ == SampleFormat::kU8) {
        out->push_back(ToU8(sample));
        return;
    }
    const uint16_t v = static_cast<uint16_t>(ToS16(sample));
    out->push_back(static_cast<uint8_t>(v & 0xff));
    out->push_back(static_cast<uint8_t>((v >> 8) & 0xff));
}

}  // namespace blip
