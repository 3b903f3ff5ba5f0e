// ==============================================================================
// Layer 0: Core Utility - Level Scaling
// ==============================================================================
// Maps the game level onto a pitch multiplier. Every cue that takes a level
// multiplies its frequencies by levelFactor(), so chords and melodies keep
// their intervals while the whole cue rises with progression.
//
// 3% per level is roughly half a semitone:
//   level 1 -> x1.00, level 5 -> x1.12, level 10 -> x1.27, level 30 -> x1.87
// ==============================================================================

#pragma once

#include <algorithm>

namespace Bleep {
namespace Sfx {

/// Default pitch increase per level above 1 (ratio, 0.03 = +3%)
inline constexpr float kDefaultLevelStepRatio = 0.03f;

/// Default highest level that still raises pitch
inline constexpr int kDefaultMaxScaledLevel = 30;

/// Smallest accepted maxScaledLevel; levels 1 through 5 always rise in pitch
inline constexpr int kMinScaledLevel = 5;

/// Number of notes a line clear can play (one per cleared row)
inline constexpr int kMaxLineClearVoices = 4;

/// @brief Level-to-pitch mapping with clamped input.
///
/// Value type; the engine owns one configured from SoundEngineConfig.
struct LevelScaling {
    float stepRatio = kDefaultLevelStepRatio;
    int maxLevel = kDefaultMaxScaledLevel;

    /// @brief Clamp an arbitrary level into [1, maxLevel].
    [[nodiscard]] constexpr int clampLevel(int level) const noexcept {
        return std::clamp(level, 1, std::max(maxLevel, 1));
    }

    /// @brief Multiplicative pitch factor for a level.
    /// @return 1 + (clamp(level) - 1) * stepRatio, never below 1 for a non-negative step
    [[nodiscard]] constexpr float factor(int level) const noexcept {
        return 1.0f + static_cast<float>(clampLevel(level) - 1) * stepRatio;
    }
};

/// @brief Number of line-clear voices for a reported line count, clamped to [1, 4].
[[nodiscard]] constexpr int clampLineCount(int lineCount) noexcept {
    return std::clamp(lineCount, 1, kMaxLineClearVoices);
}

} // namespace Sfx
} // namespace Bleep
