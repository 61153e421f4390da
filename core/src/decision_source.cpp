#include "blip/decision_source.h"

namespace blip {

namespace {
constexpr uint64_t kGoldenGamma = 0x9e3779b97f4a7c15ULL;
constexpr double kUnitScale = 1.0 / 9007199254740992.0;  // 2^-53
}  // namespace

DecisionSource::DecisionSource(uint64_t seed) {
    reset(seed);
}

void DecisionSource::reset(uint64_t seed) {
    seed_ = seed;
    state_ = seed;
    draws_ = 0;
}

uint64_t DecisionSource::next_u64() {
    ++draws_;
    state_ += kGoldenGamma;
    uint64_t z = state_;
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31);
}

double DecisionSource::next() {
    return static_cast<double>(next_u64() >> 11) * kUnitScale;
}

DecisionSource DecisionSource::split() {
    return DecisionSource(next_u64());
}

}  // namespace blip
