#pragma once

#include <cstdint>

namespace blip {

// Reproducible stream of uniform draws in [0, 1).
// SplitMix64 underneath: plain 64-bit integer arithmetic, so a seed gives
// bit-identical results on every platform and standard library.
class DecisionSource {
public:
    explicit DecisionSource(uint64_t seed = 0);

    void reset(uint64_t seed);

    // Next uniform value in [0, 1). Top 53 bits of the next raw output.
    double next();

    // Next raw 64-bit output.
    uint64_t next_u64();

    // Independent child stream, seeded from one raw draw of this stream.
    DecisionSource split();

    uint64_t seed() const { return seed_; }
    uint64_t draws() const { return draws_; }

private:
    uint64_t seed_ = 0;
    uint64_t state_ = 0;
    uint64_t draws_ = 0;
};

}  // namespace blip
