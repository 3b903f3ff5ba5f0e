// ==============================================================================
// Layer 3: Engine - Effect Library
// ==============================================================================
// Recipes for every game cue. Each recipe reads the context clock once, builds
// its voices with the voice builders and routes them into the given output
// (the engine passes its master gain).
//
// | Cue        | Voices                                                   |
// |------------|----------------------------------------------------------|
// | Rotate     | 1 sine click                                             |
// | Hard drop  | bandpassed noise thud + sine pitch drop                  |
// | Line clear | 1-4 triangle notes of a C major arpeggio                 |
// | Combo 6-7  | sawtooth riser + sine sub bass + 4 square arpeggio notes |
// | Level up   | 5 triangle notes, C D E G C                              |
// | Game over  | 6 descending sawtooth notes + sine C2 bass               |
//
// All pitches except the game-over cue are multiplied by the level factor.
// ==============================================================================

#pragma once

#include <bleep/sfx/core/level_scaling.h>
#include <bleep/sfx/core/white_noise.h>
#include <bleep/sfx/engine/sound_engine_config.h>
#include <bleep/sfx/graph/audio_graph.h>

#include <array>
#include <cstdint>

namespace Bleep {
namespace Sfx {

// =============================================================================
// Note Tables (Hz, before level scaling)
// =============================================================================

inline constexpr std::array<float, 4> kLineClearNotes = {261.63f, 329.63f, 392.0f, 523.25f};
inline constexpr std::array<float, 4> kComboArpeggioNotes = {440.0f, 554.37f, 659.25f, 880.0f};
inline constexpr std::array<float, 5> kLevelUpNotes = {261.63f, 293.66f, 329.63f, 392.0f, 523.25f};
inline constexpr std::array<float, 6> kGameOverNotes = {523.25f, 493.88f, 440.0f, 392.0f, 349.23f, 261.63f};

/// Game-over bass (C2), never level-scaled
inline constexpr float kGameOverBassFrequency = 65.41f;

// =============================================================================
// EffectLibrary
// =============================================================================

/// @brief Schedules the voices of each cue into an output node.
class EffectLibrary {
public:
    explicit EffectLibrary(const LevelScaling& scaling = {},
                           uint32_t noiseSeed = kDefaultNoiseSeed) noexcept
        : scaling_(scaling)
        , noise_(noiseSeed) {}

    void rotate(AudioContext& context, AudioNode& output, int level);
    void hardDrop(AudioContext& context, AudioNode& output, int level);

    /// @param lineCount Rows cleared; clamped to [1, 4] voices
    void lineClear(AudioContext& context, AudioNode& output, int lineCount, int level);

    void combo67(AudioContext& context, AudioNode& output, int level);
    void levelUp(AudioContext& context, AudioNode& output, int level);
    void gameOver(AudioContext& context, AudioNode& output);

    [[nodiscard]] float levelFactor(int level) const noexcept { return scaling_.factor(level); }
    [[nodiscard]] const LevelScaling& scaling() const noexcept { return scaling_; }

private:
    LevelScaling scaling_;
    WhiteNoise noise_;
};

} // namespace Sfx
} // namespace Bleep
