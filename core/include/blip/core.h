#pragma once

namespace blip {

struct Version {
    static constexpr int kMajor = 0;
    static constexpr int kMinor = 2;
    static constexpr int kPatch = 0;
};

constexpr int kDefaultSampleRate = 8000;

}  // namespace blip
