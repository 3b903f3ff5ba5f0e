// ==============================================================================
// Layer 3: Engine - Sound Engine
// ==============================================================================
// Public entry point for game code: one call per game event, each building a
// short-lived synthesized subgraph on the host's audio graph.
//
// Behaviour:
// - Construction performs no audio work; the host context is created by the
//   first play call that is not muted.
// - Muted play calls return before touching the host.
// - Host failures never reach the caller: a missing host disables sound, and
//   exceptions thrown while building a cue are logged and dropped.
//
// Usage:
// @code
// OfflineGraphHost host;
// SoundEngine engine(&host);
// engine.playLineClear(4, level);
// engine.toggleMute();
// @endcode
//
// Single control thread. The host must outlive the engine.
// ==============================================================================

#pragma once

#include <bleep/sfx/engine/effect_library.h>
#include <bleep/sfx/engine/graph_context.h>
#include <bleep/sfx/engine/mute_controller.h>
#include <bleep/sfx/engine/sfx_event.h>
#include <bleep/sfx/engine/sound_engine_config.h>
#include <bleep/sfx/graph/audio_graph.h>

namespace Bleep {
namespace Sfx {

class SoundEngine {
public:
    /// @param host Audio host (non-owning, may be nullptr)
    /// @param config Tunables; sanitized on construction
    explicit SoundEngine(AudioGraphHost* host, const SoundEngineConfig& config = {});
    ~SoundEngine();

    SoundEngine(const SoundEngine&) = delete;
    SoundEngine& operator=(const SoundEngine&) = delete;

    // =========================================================================
    // Cues
    // =========================================================================

    /// @brief Short sine click; pitch rises with level.
    void playRotate(int level);

    /// @brief Filtered noise thud plus a falling sine thump.
    void playHardDrop(int level);

    /// @brief One arpeggio note per cleared row (1-4).
    void playLineClear(int lineCount, int level);

    /// @brief Riser, sub bass and A-major arpeggio for the 6-7 combo.
    void playCombo67(int level);

    void playLevelUp(int level);
    void playGameOver();

    /// @brief Dispatch by event id to the matching play method.
    void play(SfxEvent event, const EffectParams& params = {});

    // =========================================================================
    // Mute / Volume
    // =========================================================================

    [[nodiscard]] bool isMuted() const noexcept { return mute_.isMuted(); }

    /// @brief Set the mute flag; an existing context ramps its master gain.
    void setMuted(bool muted);

    /// @return The new mute state
    bool toggleMute();

    /// @brief Master level in [0, 1] used while unmuted. NaN is ignored.
    void setMasterVolume(float volume);
    [[nodiscard]] float masterVolume() const noexcept { return mute_.masterVolume(); }

    // =========================================================================
    // State
    // =========================================================================

    /// @brief Whether the host context has been created.
    [[nodiscard]] bool hasContext() const noexcept { return graph_.ready(); }

    [[nodiscard]] const SoundEngineConfig& config() const noexcept { return config_; }

private:
    template <typename Recipe>
    void playCue(const char* name, Recipe&& recipe);

    void applyMasterLevel();

    SoundEngineConfig config_;
    MuteController mute_;
    EffectLibrary effects_;
    GraphContext graph_;
};

} // namespace Sfx
} // namespace Bleep
