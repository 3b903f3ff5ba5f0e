// ==============================================================================
// Layer 0: Core Utility - White Noise
// ==============================================================================
// Seeded white noise for percussive bursts. Successive fills continue one
// sequence: bursts differ from each other, yet a seed replays the same series
// of bursts. Not suitable for anything but audio.
// ==============================================================================

#pragma once

#include <cstddef>
#include <cstdint>

namespace Bleep {
namespace Sfx {

class WhiteNoise {
public:
    /// @param seed Any value; 0 is replaced by a fixed non-zero seed
    explicit constexpr WhiteNoise(uint32_t seed) noexcept
        : state_(seed != 0 ? seed : kZeroSeedReplacement) {}

    /// @brief Overwrite count samples with noise uniform in [-1, 1].
    constexpr void fill(float* samples, size_t count) noexcept {
        for (size_t i = 0; i < count; ++i) {
            samples[i] = nextSample();
        }
    }

private:
    // Marsaglia xorshift (13, 17, 5); a zero state would stay zero forever
    constexpr float nextSample() noexcept {
        state_ ^= state_ << 13;
        state_ ^= state_ >> 17;
        state_ ^= state_ << 5;
        return static_cast<float>(static_cast<double>(state_) * kUnitScale - 1.0);
    }

    static constexpr uint32_t kZeroSeedReplacement = 0x9E3779B9u;
    static constexpr double kUnitScale = 2.0 / 4294967295.0;

    uint32_t state_;
};

} // namespace Sfx
} // namespace Bleep
