// ==============================================================================
// Host Audio Graph Interface - AudioBuffer Implementation
// ==============================================================================

#include "audio_graph.h"

#include <algorithm>

namespace Bleep {
namespace Sfx {

AudioBuffer::AudioBuffer(size_t numChannels, size_t length, float sampleRate)
    : channels_(std::max<size_t>(numChannels, 1), std::vector<float>(length, 0.0f))
    , length_(length)
    , sampleRate_(sampleRate) {}

double AudioBuffer::duration() const noexcept {
    return (sampleRate_ > 0.0f) ? static_cast<double>(length_) / sampleRate_ : 0.0;
}

float* AudioBuffer::channelData(size_t channel) noexcept {
    return channel < channels_.size() ? channels_[channel].data() : nullptr;
}

const float* AudioBuffer::channelData(size_t channel) const noexcept {
    return channel < channels_.size() ? channels_[channel].data() : nullptr;
}

} // namespace Sfx
} // namespace Bleep
