// ==============================================================================
// Voice Builders Implementation
// ==============================================================================

#include "voice_builder.h"

#include <bleep/sfx/core/math_constants.h>
#include <bleep/sfx/core/time_utils.h>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>

namespace Bleep {
namespace Sfx {

namespace {

/// Throws when a host factory yields null
template <typename T>
std::shared_ptr<T> require(std::shared_ptr<T> node, const char* what) {
    if (!node) {
        throw std::runtime_error(std::string("audio host returned no ") + what);
    }
    return node;
}

void scheduleEnvelope(AudioParam& gain, float peak, double start, double length) {
    gain.setValueAtTime(peak, start);
    gain.exponentialRampToValueAtTime(kEnvelopeFloor, start + length);
}

} // namespace

void scheduleTone(AudioContext& context, AudioNode& output, const ToneSpec& tone, double now) {
    const double start = now + std::max(tone.onset, 0.0);
    const double stop = start + std::max(tone.durationSeconds, 0.0);

    auto osc = require(context.createOscillator(), "oscillator");
    auto gain = require(context.createGain(), "gain");

    osc->setType(tone.waveform);
    osc->frequency().setValueAtTime(tone.frequency, start);
    if (tone.glideTo > 0.0f) {
        osc->frequency().exponentialRampToValueAtTime(tone.glideTo, stop);
    }
    scheduleEnvelope(gain->gain(), tone.peakGain, start, std::max(tone.envelopeSeconds, 0.0));

    osc->connect(*gain);
    gain->connect(output);
    osc->start(start);
    osc->stop(stop);
}

void scheduleNoiseBurst(AudioContext& context,
                        AudioNode& output,
                        const NoiseBurstSpec& burst,
                        WhiteNoise& noise,
                        double now) {
    const float sampleRate = context.sampleRate();
    const double duration = std::max(burst.durationSeconds, 0.0);
    const size_t length = std::max<size_t>(secondsToFrames(duration, sampleRate), 1);

    auto buffer = require(context.createBuffer(1, length, sampleRate), "buffer");
    if (float* samples = buffer->channelData(0)) {
        noise.fill(samples, buffer->length());
    }

    auto source = require(context.createBufferSource(), "buffer source");
    auto filter = require(context.createBiquadFilter(), "biquad filter");
    auto gain = require(context.createGain(), "gain");

    source->setBuffer(buffer);
    filter->setType(burst.filterType);
    filter->frequency().setValueAtTime(burst.filterFrequency, now);
    filter->q().setValue(burst.filterQ);
    scheduleEnvelope(gain->gain(), burst.peakGain, now, duration);

    source->connect(*filter);
    filter->connect(*gain);
    gain->connect(output);
    source->start(now);
    source->stop(now + duration);
}

} // namespace Sfx
} // namespace Bleep
