// ==============================================================================
// Layer 2: Graph - Host Audio Graph Interface
// ==============================================================================
// The capability surface the sound engine needs from a host audio engine:
// a context with a clock and run state, node factories, scheduled parameters
// and a destination sink. Real hosts (a device backend, a browser bridge) and
// the offline renderer implement these interfaces; tests substitute a
// recording fake.
//
// Ownership model:
// - Factories return shared handles. Connecting a node into the graph gives
//   the graph shared ownership, so callers may drop their handles right after
//   scheduling. The host releases a node once it can no longer sound.
// - AudioContext is owned by whoever asked the host for it.
//
// Threading: all calls come from one control thread. Only the resume
// completion callback may be invoked from elsewhere.
// ==============================================================================

#pragma once

#include <bleep/sfx/primitives/biquad.h>
#include <bleep/sfx/primitives/tone_oscillator.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string_view>
#include <vector>

namespace Bleep {
namespace Sfx {

// =============================================================================
// Context Run State
// =============================================================================

/// @brief Run state reported by a host context.
enum class ContextState : uint8_t {
    Suspended,  ///< Clock stopped, output muted by the host (e.g. awaiting a user gesture)
    Running,    ///< Rendering
    Closed      ///< Released; no further rendering
};

// =============================================================================
// AudioParam
// =============================================================================

/// @brief A schedulable node parameter (gain, frequency, Q).
///
/// Times are absolute context seconds.
class AudioParam {
public:
    virtual ~AudioParam() = default;

    /// @brief Immediate write of the current value.
    virtual void setValue(float value) = 0;

    /// @brief Value at the context's current time.
    [[nodiscard]] virtual float value() const = 0;

    virtual void setValueAtTime(float value, double time) = 0;
    virtual void linearRampToValueAtTime(float value, double endTime) = 0;

    /// @brief Geometric ramp; value must be non-zero and share the sign of the previous value.
    virtual void exponentialRampToValueAtTime(float value, double endTime) = 0;

    /// @brief Smoothed exponential approach toward target, anchored at startTime.
    virtual void setTargetAtTime(float target, double startTime, double timeConstant) = 0;

    virtual void cancelScheduledValues(double startTime) = 0;
};

// =============================================================================
// Nodes
// =============================================================================

/// @brief Base of every graph node.
class AudioNode {
public:
    virtual ~AudioNode() = default;

    /// @brief Route this node's output into destination's input.
    virtual void connect(AudioNode& destination) = 0;
};

/// @brief Scales its summed input by a gain parameter.
class GainNode : public AudioNode {
public:
    [[nodiscard]] virtual AudioParam& gain() = 0;
};

/// @brief A node that produces sound between a start and a stop time.
class ScheduledSourceNode : public AudioNode {
public:
    virtual void start(double when) = 0;
    virtual void stop(double when) = 0;
};

/// @brief Periodic waveform generator.
class OscillatorNode : public ScheduledSourceNode {
public:
    virtual void setType(OscWaveform type) = 0;
    [[nodiscard]] virtual OscWaveform type() const = 0;
    [[nodiscard]] virtual AudioParam& frequency() = 0;
};

class AudioBuffer;

/// @brief One-shot playback of an AudioBuffer.
class BufferSourceNode : public ScheduledSourceNode {
public:
    virtual void setBuffer(std::shared_ptr<const AudioBuffer> buffer) = 0;
};

/// @brief Second-order filter with frequency and Q parameters.
class BiquadFilterNode : public AudioNode {
public:
    virtual void setType(FilterType type) = 0;
    [[nodiscard]] virtual FilterType type() const = 0;
    [[nodiscard]] virtual AudioParam& frequency() = 0;
    [[nodiscard]] virtual AudioParam& q() = 0;
};

// =============================================================================
// AudioBuffer
// =============================================================================

/// @brief Planar float sample storage for buffer sources.
class AudioBuffer {
public:
    /// @param numChannels Channel count (0 treated as 1)
    /// @param length Frames per channel
    /// @param sampleRate Sample rate the data was generated at
    AudioBuffer(size_t numChannels, size_t length, float sampleRate);

    [[nodiscard]] size_t numChannels() const noexcept { return channels_.size(); }
    [[nodiscard]] size_t length() const noexcept { return length_; }
    [[nodiscard]] float sampleRate() const noexcept { return sampleRate_; }

    /// @brief Duration in seconds (0 for an invalid sample rate).
    [[nodiscard]] double duration() const noexcept;

    /// @brief Mutable samples of a channel; nullptr for an out-of-range channel.
    [[nodiscard]] float* channelData(size_t channel) noexcept;
    [[nodiscard]] const float* channelData(size_t channel) const noexcept;

private:
    std::vector<std::vector<float>> channels_;
    size_t length_;
    float sampleRate_;
};

// =============================================================================
// AudioContext
// =============================================================================

/// @brief Completion of a resume request: resumed == false carries a reason.
using ResumeCallback = std::function<void(bool resumed, std::string_view reason)>;

/// @brief A host audio-processing context: clock, run state and node factories.
class AudioContext {
public:
    virtual ~AudioContext() = default;

    /// @brief Context clock in seconds. Advances only while running.
    [[nodiscard]] virtual double currentTime() const = 0;

    [[nodiscard]] virtual float sampleRate() const = 0;
    [[nodiscard]] virtual ContextState state() const = 0;

    /// @brief Request a transition to Running. Returns immediately; the
    /// callback (if any) fires once the host has decided.
    virtual void resume(ResumeCallback onComplete) = 0;

    /// @brief Final sink of the graph.
    [[nodiscard]] virtual AudioNode& destination() = 0;

    [[nodiscard]] virtual std::shared_ptr<GainNode> createGain() = 0;
    [[nodiscard]] virtual std::shared_ptr<OscillatorNode> createOscillator() = 0;
    [[nodiscard]] virtual std::shared_ptr<BufferSourceNode> createBufferSource() = 0;
    [[nodiscard]] virtual std::shared_ptr<BiquadFilterNode> createBiquadFilter() = 0;
    [[nodiscard]] virtual std::shared_ptr<AudioBuffer> createBuffer(
        size_t numChannels, size_t length, float sampleRate) = 0;
};

// =============================================================================
// AudioGraphHost
// =============================================================================

/// @brief Factory for audio contexts: the entry point into a host audio engine.
class AudioGraphHost {
public:
    virtual ~AudioGraphHost() = default;

    /// @brief Create a new context.
    /// @return nullptr when the host cannot provide audio (no device, unsupported)
    [[nodiscard]] virtual std::unique_ptr<AudioContext> createContext() = 0;
};

} // namespace Sfx
} // namespace Bleep
