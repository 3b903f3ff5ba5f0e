// ==============================================================================
// Layer 3: Engine - Configuration
// ==============================================================================
// Tunables of the sound engine. Defaults reproduce the stock cue set; a host
// application may override them at construction. Values are sanitized, never
// rejected.
// ==============================================================================

#pragma once

#include <bleep/sfx/core/float_checks.h>
#include <bleep/sfx/core/level_scaling.h>

#include <algorithm>
#include <cstdint>

namespace Bleep {
namespace Sfx {

/// Smoothing time constant of mute/unmute and volume changes, seconds
inline constexpr double kDefaultMuteTimeConstant = 0.01;

/// Default seed of the noise generator behind percussive bursts
inline constexpr uint32_t kDefaultNoiseSeed = 0x6C8E9CF5u;

/// @brief Engine construction parameters.
struct SoundEngineConfig {
    double muteTimeConstantSeconds = kDefaultMuteTimeConstant;
    float levelStepRatio = kDefaultLevelStepRatio;   ///< Pitch ratio added per level
    int maxScaledLevel = kDefaultMaxScaledLevel;     ///< Levels above this sound the same
    float masterVolume = 1.0f;                       ///< Master level when unmuted, [0, 1]
    uint32_t noiseSeed = kDefaultNoiseSeed;

    /// @brief Copy with every field forced into its valid range.
    ///
    /// - non-positive or non-finite time constant -> default
    /// - non-positive or non-finite step ratio -> default
    /// - maxScaledLevel below kMinScaledLevel -> kMinScaledLevel
    /// - volume clamped to [0, 1], NaN -> 1
    [[nodiscard]] SoundEngineConfig sanitized() const noexcept {
        SoundEngineConfig out = *this;
        if (!detail::isFinite(out.muteTimeConstantSeconds) || out.muteTimeConstantSeconds <= 0.0) {
            out.muteTimeConstantSeconds = kDefaultMuteTimeConstant;
        }
        if (!detail::isFinite(out.levelStepRatio) || out.levelStepRatio <= 0.0f) {
            out.levelStepRatio = kDefaultLevelStepRatio;
        }
        out.maxScaledLevel = std::max(out.maxScaledLevel, kMinScaledLevel);
        out.masterVolume = detail::isNaN(out.masterVolume)
            ? 1.0f
            : std::clamp(out.masterVolume, 0.0f, 1.0f);
        return out;
    }

    [[nodiscard]] LevelScaling levelScaling() const noexcept {
        return LevelScaling{levelStepRatio, maxScaledLevel};
    }
};

} // namespace Sfx
} // namespace Bleep
