// ==============================================================================
// Effect Library Implementation
// ==============================================================================

#include "effect_library.h"

#include <bleep/sfx/engine/voice_builder.h>

#include <cstddef>

namespace Bleep {
namespace Sfx {

namespace {

// Rotate
constexpr float kRotateBaseFrequency = 880.0f;
constexpr float kRotateStepPerLevel = 40.0f;
constexpr float kRotateGain = 0.3f;
constexpr double kRotateSeconds = 0.05;

// Hard drop
constexpr double kHardDropSeconds = 0.1;
constexpr float kHardDropNoiseFrequency = 120.0f;
constexpr float kHardDropNoiseQ = 1.5f;
constexpr float kHardDropNoiseGain = 0.4f;
constexpr float kHardDropThumpFrequency = 40.0f;
constexpr float kHardDropThumpFloor = 20.0f;
constexpr float kHardDropThumpGain = 0.5f;

// Line clear
constexpr double kLineClearSpacing = 0.06;
constexpr double kLineClearSeconds = 0.25;
constexpr float kLineClearGain = 0.35f;

// Combo
constexpr double kComboSeconds = 0.8;
constexpr float kComboSweepStart = 110.0f;
constexpr float kComboSweepEnd = 880.0f;
constexpr float kComboSweepGain = 0.2f;
constexpr float kComboBassFrequency = 55.0f;
constexpr float kComboBassGain = 0.5f;
constexpr double kComboBassDecayRatio = 0.6;
constexpr double kComboArpeggioSpacing = 0.12;
constexpr double kComboArpeggioSeconds = 0.18;
constexpr float kComboArpeggioGain = 0.15f;

// Level up
constexpr double kLevelUpSpacing = 0.08;
constexpr double kLevelUpSeconds = 0.15;
constexpr float kLevelUpGain = 0.3f;

// Game over
constexpr double kGameOverSpacing = 0.14;
constexpr double kGameOverSeconds = 0.2;
constexpr float kGameOverGain = 0.25f;
constexpr double kGameOverBassSeconds = 1.0;
constexpr float kGameOverBassGain = 0.4f;

/// Enveloped note whose envelope spans its whole duration
[[nodiscard]] ToneSpec note(OscWaveform waveform, float frequency, double onset,
                            double seconds, float gain) noexcept {
    ToneSpec tone;
    tone.waveform = waveform;
    tone.frequency = frequency;
    tone.onset = onset;
    tone.envelopeSeconds = seconds;
    tone.durationSeconds = seconds;
    tone.peakGain = gain;
    return tone;
}

} // namespace

void EffectLibrary::rotate(AudioContext& context, AudioNode& output, int level) {
    const int clamped = scaling_.clampLevel(level);
    const float frequency =
        (kRotateBaseFrequency + static_cast<float>(clamped - 1) * kRotateStepPerLevel) * scaling_.factor(clamped);

    scheduleTone(context, output,
                 note(OscWaveform::Sine, frequency, 0.0, kRotateSeconds, kRotateGain),
                 context.currentTime());
}

void EffectLibrary::hardDrop(AudioContext& context, AudioNode& output, int level) {
    const float lf = scaling_.factor(level);
    const double now = context.currentTime();

    NoiseBurstSpec thud;
    thud.durationSeconds = kHardDropSeconds;
    thud.filterType = FilterType::Bandpass;
    thud.filterFrequency = kHardDropNoiseFrequency * lf;
    thud.filterQ = kHardDropNoiseQ;
    thud.peakGain = kHardDropNoiseGain;
    scheduleNoiseBurst(context, output, thud, noise_, now);

    ToneSpec thump = note(OscWaveform::Sine, kHardDropThumpFrequency * lf, 0.0,
                          kHardDropSeconds, kHardDropThumpGain);
    thump.glideTo = kHardDropThumpFloor;
    scheduleTone(context, output, thump, now);
}

void EffectLibrary::lineClear(AudioContext& context, AudioNode& output, int lineCount, int level) {
    const float lf = scaling_.factor(level);
    const double now = context.currentTime();
    const auto voices = static_cast<size_t>(clampLineCount(lineCount));

    for (size_t i = 0; i < voices; ++i) {
        scheduleTone(context, output,
                     note(OscWaveform::Triangle, kLineClearNotes[i] * lf,
                          static_cast<double>(i) * kLineClearSpacing,
                          kLineClearSeconds, kLineClearGain),
                     now);
    }
}

void EffectLibrary::combo67(AudioContext& context, AudioNode& output, int level) {
    const float lf = scaling_.factor(level);
    const double now = context.currentTime();

    // Riser
    ToneSpec sweep = note(OscWaveform::Sawtooth, kComboSweepStart * lf, 0.0,
                          kComboSeconds, kComboSweepGain);
    sweep.glideTo = kComboSweepEnd * lf;
    scheduleTone(context, output, sweep, now);

    // Sub bass decays early but keeps running to the end of the riser
    ToneSpec bass = note(OscWaveform::Sine, kComboBassFrequency * lf, 0.0,
                         kComboSeconds, kComboBassGain);
    bass.envelopeSeconds = kComboSeconds * kComboBassDecayRatio;
    scheduleTone(context, output, bass, now);

    for (size_t i = 0; i < kComboArpeggioNotes.size(); ++i) {
        scheduleTone(context, output,
                     note(OscWaveform::Square, kComboArpeggioNotes[i] * lf,
                          static_cast<double>(i) * kComboArpeggioSpacing,
                          kComboArpeggioSeconds, kComboArpeggioGain),
                     now);
    }
}

void EffectLibrary::levelUp(AudioContext& context, AudioNode& output, int level) {
    const float lf = scaling_.factor(level);
    const double now = context.currentTime();

    for (size_t i = 0; i < kLevelUpNotes.size(); ++i) {
        scheduleTone(context, output,
                     note(OscWaveform::Triangle, kLevelUpNotes[i] * lf,
                          static_cast<double>(i) * kLevelUpSpacing,
                          kLevelUpSeconds, kLevelUpGain),
                     now);
    }
}

void EffectLibrary::gameOver(AudioContext& context, AudioNode& output) {
    const double now = context.currentTime();

    for (size_t i = 0; i < kGameOverNotes.size(); ++i) {
        scheduleTone(context, output,
                     note(OscWaveform::Sawtooth, kGameOverNotes[i],
                          static_cast<double>(i) * kGameOverSpacing,
                          kGameOverSeconds, kGameOverGain),
                     now);
    }

    scheduleTone(context, output,
                 note(OscWaveform::Sine, kGameOverBassFrequency, 0.0,
                      kGameOverBassSeconds, kGameOverBassGain),
                 now);
}

} // namespace Sfx
} // namespace Bleep
