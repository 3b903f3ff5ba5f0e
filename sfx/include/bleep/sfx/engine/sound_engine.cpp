// ==============================================================================
// Sound Engine Implementation
// ==============================================================================

#include "sound_engine.h"

#include <bleep/sfx/core/logging.h>

#include <exception>
#include <utility>

namespace Bleep {
namespace Sfx {

SoundEngine::SoundEngine(AudioGraphHost* host, const SoundEngineConfig& config)
    : config_(config.sanitized())
    , mute_(config_.muteTimeConstantSeconds, config_.masterVolume)
    , effects_(config_.levelScaling(), config_.noiseSeed)
    , graph_(host) {}

SoundEngine::~SoundEngine() = default;

template <typename Recipe>
void SoundEngine::playCue(const char* name, Recipe&& recipe) {
    if (mute_.isMuted()) {
        return;
    }
    try {
        if (!graph_.ensure(mute_.targetGain())) {
            return;
        }
        std::forward<Recipe>(recipe)(*graph_.context(), *graph_.masterGain());
    } catch (const std::exception& e) {
        BLEEP_SFX_LOG_ERROR("%s cue dropped: %s", name, e.what());
    }
}

void SoundEngine::playRotate(int level) {
    playCue("rotate", [this, level](AudioContext& context, AudioNode& output) {
        effects_.rotate(context, output, level);
    });
}

void SoundEngine::playHardDrop(int level) {
    playCue("hard drop", [this, level](AudioContext& context, AudioNode& output) {
        effects_.hardDrop(context, output, level);
    });
}

void SoundEngine::playLineClear(int lineCount, int level) {
    playCue("line clear", [this, lineCount, level](AudioContext& context, AudioNode& output) {
        effects_.lineClear(context, output, lineCount, level);
    });
}

void SoundEngine::playCombo67(int level) {
    playCue("combo", [this, level](AudioContext& context, AudioNode& output) {
        effects_.combo67(context, output, level);
    });
}

void SoundEngine::playLevelUp(int level) {
    playCue("level up", [this, level](AudioContext& context, AudioNode& output) {
        effects_.levelUp(context, output, level);
    });
}

void SoundEngine::playGameOver() {
    playCue("game over", [this](AudioContext& context, AudioNode& output) {
        effects_.gameOver(context, output);
    });
}

void SoundEngine::play(SfxEvent event, const EffectParams& params) {
    switch (event) {
        case SfxEvent::Rotate:    playRotate(params.level); break;
        case SfxEvent::HardDrop:  playHardDrop(params.level); break;
        case SfxEvent::LineClear: playLineClear(params.lineCount, params.level); break;
        case SfxEvent::Combo67:   playCombo67(params.level); break;
        case SfxEvent::LevelUp:   playLevelUp(params.level); break;
        case SfxEvent::GameOver:  playGameOver(); break;
    }
}

void SoundEngine::setMuted(bool muted) {
    mute_.setMuted(muted);
    applyMasterLevel();
}

bool SoundEngine::toggleMute() {
    setMuted(!mute_.isMuted());
    return mute_.isMuted();
}

void SoundEngine::setMasterVolume(float volume) {
    if (!mute_.setMasterVolume(volume)) {
        BLEEP_SFX_LOG_WARN("setMasterVolume ignored NaN");
        return;
    }
    if (!mute_.isMuted()) {
        applyMasterLevel();
    }
}

void SoundEngine::applyMasterLevel() {
    if (!graph_.ready()) {
        return;
    }
    try {
        mute_.applyTo(graph_.masterGain()->gain(), graph_.context()->currentTime());
    } catch (const std::exception& e) {
        BLEEP_SFX_LOG_ERROR("master gain update failed: %s", e.what());
    }
}

} // namespace Sfx
} // namespace Bleep
