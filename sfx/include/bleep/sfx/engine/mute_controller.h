// ==============================================================================
// Layer 3: Engine - Mute Controller
// ==============================================================================
// Mute flag and master level. Changes reach the master gain as a smoothed
// setTargetAtTime() approach, never as a hard value write, so muting mid-cue
// does not click.
// ==============================================================================

#pragma once

#include <bleep/sfx/engine/sound_engine_config.h>
#include <bleep/sfx/graph/audio_graph.h>

namespace Bleep {
namespace Sfx {

class MuteController {
public:
    explicit MuteController(double timeConstantSeconds = kDefaultMuteTimeConstant,
                            float masterVolume = 1.0f) noexcept;

    [[nodiscard]] bool isMuted() const noexcept { return muted_; }
    void setMuted(bool muted) noexcept { muted_ = muted; }

    /// @brief Store a master level, clamped to [0, 1].
    /// @return false (and no change) for NaN
    bool setMasterVolume(float volume) noexcept;
    [[nodiscard]] float masterVolume() const noexcept { return volume_; }

    /// @brief Level the master gain should settle at: 0 when muted, else the master volume.
    [[nodiscard]] float targetGain() const noexcept { return muted_ ? 0.0f : volume_; }

    [[nodiscard]] double timeConstant() const noexcept { return timeConstant_; }

    /// @brief Schedule the master gain toward targetGain() from `now`.
    void applyTo(AudioParam& masterGain, double now) const;

private:
    double timeConstant_;
    float volume_;
    bool muted_ = false;
};

} // namespace Sfx
} // namespace Bleep
