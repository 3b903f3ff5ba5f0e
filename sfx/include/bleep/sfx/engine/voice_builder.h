// ==============================================================================
// Layer 3: Engine - Voice Builders
// ==============================================================================
// The two transient subgraphs every cue is assembled from:
//
//   Tone:        Oscillator -> Gain(envelope) -> output
//   Noise burst: BufferSource(white noise) -> Biquad -> Gain(envelope) -> output
//
// Envelopes jump to the peak at the onset and decay exponentially to
// kEnvelopeFloor. Sources are started and stopped up front; nothing is kept
// after scheduling, the host owns the nodes until they stop.
// ==============================================================================

#pragma once

#include <bleep/sfx/core/white_noise.h>
#include <bleep/sfx/graph/audio_graph.h>
#include <bleep/sfx/primitives/biquad.h>
#include <bleep/sfx/primitives/tone_oscillator.h>

namespace Bleep {
namespace Sfx {

/// @brief One enveloped oscillator voice.
struct ToneSpec {
    OscWaveform waveform = OscWaveform::Sine;
    float frequency = 440.0f;       ///< Hz at the onset
    float glideTo = 0.0f;           ///< > 0: exponential glide reaching this Hz at the stop time
    double onset = 0.0;             ///< Seconds after "now"
    double envelopeSeconds = 0.1;   ///< Decay length from peak to floor
    double durationSeconds = 0.1;   ///< Onset-to-stop length
    float peakGain = 0.3f;
};

/// @brief One filtered, enveloped white-noise burst.
struct NoiseBurstSpec {
    double durationSeconds = 0.1;   ///< Buffer length, envelope and stop time
    FilterType filterType = FilterType::Bandpass;
    float filterFrequency = 1000.0f;
    float filterQ = 1.0f;
    float peakGain = 0.4f;
};

/// @brief Build and schedule a tone starting at now + tone.onset.
void scheduleTone(AudioContext& context, AudioNode& output, const ToneSpec& tone, double now);

/// @brief Build and schedule a noise burst starting at now.
/// @param noise Noise source; continues its sequence into the new buffer
void scheduleNoiseBurst(AudioContext& context,
                        AudioNode& output,
                        const NoiseBurstSpec& burst,
                        WhiteNoise& noise,
                        double now);

} // namespace Sfx
} // namespace Bleep
