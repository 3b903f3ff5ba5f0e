// ==============================================================================
// Layer 2: Graph - Offline Render Nodes
// ==============================================================================
// Node implementations behind OfflineAudioContext. Each node renders one mono
// quantum at a time on demand (pull model) and caches the result so fan-out
// does not render twice.
//
// Lifetime rules applied after every quantum (see RenderNode::prune):
// - a source node is released once it has ended (stop time or buffer end)
// - a gain/filter node is released once it has lost every input it ever had
//   and nothing outside the graph still holds it
//
// Internal to the offline host; include offline_audio_context.h instead.
// ==============================================================================

#pragma once

#include <bleep/sfx/graph/audio_graph.h>
#include <bleep/sfx/primitives/automation_timeline.h>
#include <bleep/sfx/primitives/biquad.h>
#include <bleep/sfx/primitives/tone_oscillator.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <unordered_set>
#include <vector>

namespace Bleep {
namespace Sfx {

/// Frames rendered per pull cycle
inline constexpr size_t kRenderQuantumFrames = 128;

namespace detail {

// =============================================================================
// RenderClock
// =============================================================================

/// @brief Shared render position of one offline context.
///
/// Shared (not referenced) by nodes so a node handle outliving its context
/// stays safe to query.
struct RenderClock {
    double sampleRate = 44100.0;
    size_t framesRendered = 0;      ///< Start frame of the quantum being rendered
    size_t quantumFrames = 0;       ///< Frames in the current quantum
    uint64_t quantumIndex = 0;      ///< Incremented before each pull cycle

    [[nodiscard]] double currentTime() const noexcept {
        return static_cast<double>(framesRendered) / sampleRate;
    }

    /// @brief Time of a sample inside the current quantum.
    [[nodiscard]] double timeAt(size_t offset) const noexcept {
        return static_cast<double>(framesRendered + offset) / sampleRate;
    }
};

// =============================================================================
// ScheduledParam
// =============================================================================

/// @brief AudioParam backed by an AutomationTimeline, evaluated per sample.
class ScheduledParam final : public AudioParam {
public:
    ScheduledParam(std::shared_ptr<const RenderClock> clock,
                   float defaultValue,
                   float minValue,
                   float maxValue);

    void setValue(float value) override;
    [[nodiscard]] float value() const override;
    void setValueAtTime(float value, double time) override;
    void linearRampToValueAtTime(float value, double endTime) override;
    void exponentialRampToValueAtTime(float value, double endTime) override;
    void setTargetAtTime(float target, double startTime, double timeConstant) override;
    void cancelScheduledValues(double startTime) override;

    /// @brief Per-sample values for the current quantum, clamped to the nominal range.
    ///
    /// Events that ended before the quantum are discarded first.
    void fillQuantum(float* output, size_t numFrames) noexcept;

    /// @brief k-rate value at the start of the current quantum.
    ///
    /// Discards past events like fillQuantum().
    [[nodiscard]] float quantumValue() noexcept;

    /// @brief Value at an absolute time, clamped to the nominal range.
    [[nodiscard]] float valueAt(double time) const noexcept;

    [[nodiscard]] const AutomationTimeline& timeline() const noexcept { return timeline_; }

private:
    std::shared_ptr<const RenderClock> clock_;
    AutomationTimeline timeline_;
    float minValue_;
    float maxValue_;
};

// =============================================================================
// RenderNode
// =============================================================================

/// @brief Rendering side of every offline node.
class RenderNode : public std::enable_shared_from_this<RenderNode> {
public:
    explicit RenderNode(std::shared_ptr<const RenderClock> clock) noexcept;
    virtual ~RenderNode() = default;

    RenderNode(const RenderNode&) = delete;
    RenderNode& operator=(const RenderNode&) = delete;

    /// @brief Output of the current quantum (rendered on first request).
    [[nodiscard]] const float* pull();

    /// @brief Wire `input` into this node; false for sources or when a cycle would form.
    bool addInput(const std::shared_ptr<RenderNode>& input);

    /// @brief Release finished upstream nodes, depth first.
    void prune(double quantumEndTime);

    /// @brief True if `node` feeds this node directly or indirectly.
    [[nodiscard]] bool isFedBy(const RenderNode* node) const;

    /// @brief Add every upstream node to `seen`.
    void collectUpstream(std::unordered_set<const RenderNode*>& seen) const;

    /// @brief Identity of the clock (and therefore the context) this node belongs to.
    [[nodiscard]] const RenderClock* clockId() const noexcept { return clock_.get(); }

    /// @brief Sources take no inputs.
    [[nodiscard]] virtual bool acceptsInput() const noexcept { return true; }

protected:
    /// @brief Produce numFrames samples for the current quantum.
    virtual void renderQuantum(float* output, size_t numFrames) = 0;

    /// @brief Whether the node can be dropped from the graph after quantumEndTime.
    [[nodiscard]] virtual bool hasFinished(double quantumEndTime) const noexcept;

    /// @brief Sum of all inputs for the current quantum into output.
    void sumInputs(float* output, size_t numFrames);

    /// @brief Connect this node into an arbitrary AudioNode (shared by all public node types).
    void connectTo(AudioNode& destination);

    std::shared_ptr<const RenderClock> clock_;

private:
    std::vector<std::shared_ptr<RenderNode>> inputs_;
    std::array<float, kRenderQuantumFrames> buffer_{};
    uint64_t renderedQuantum_ = std::numeric_limits<uint64_t>::max();
    size_t graphRefs_ = 0;
    bool hadInput_ = false;
};

// =============================================================================
// Concrete Nodes
// =============================================================================

class OfflineDestinationNode final : public AudioNode, public RenderNode {
public:
    explicit OfflineDestinationNode(std::shared_ptr<const RenderClock> clock) noexcept;

    void connect(AudioNode& destination) override;

protected:
    void renderQuantum(float* output, size_t numFrames) override;
};

class OfflineGainNode final : public GainNode, public RenderNode {
public:
    explicit OfflineGainNode(std::shared_ptr<const RenderClock> clock);

    void connect(AudioNode& destination) override;
    [[nodiscard]] AudioParam& gain() override { return gain_; }

protected:
    void renderQuantum(float* output, size_t numFrames) override;

private:
    ScheduledParam gain_;
    std::array<float, kRenderQuantumFrames> gainValues_{};
};

/// @brief Start/stop window shared by the source nodes.
struct SourceSchedule {
    static constexpr double kUnset = -1.0;

    double startTime = kUnset;
    double stopTime = kUnset;

    [[nodiscard]] bool started() const noexcept { return startTime >= 0.0; }
    [[nodiscard]] bool isActiveAt(double time) const noexcept {
        return started() && time >= startTime && (stopTime < 0.0 || time < stopTime);
    }
};

class OfflineOscillatorNode final : public OscillatorNode, public RenderNode {
public:
    explicit OfflineOscillatorNode(std::shared_ptr<const RenderClock> clock);

    void connect(AudioNode& destination) override;
    void start(double when) override;
    void stop(double when) override;
    void setType(OscWaveform type) override;
    [[nodiscard]] OscWaveform type() const override { return oscillator_.waveform(); }
    [[nodiscard]] AudioParam& frequency() override { return frequency_; }
    [[nodiscard]] bool acceptsInput() const noexcept override { return false; }

protected:
    void renderQuantum(float* output, size_t numFrames) override;
    [[nodiscard]] bool hasFinished(double quantumEndTime) const noexcept override;

private:
    ScheduledParam frequency_;
    ToneOscillator oscillator_;
    SourceSchedule schedule_;
    std::array<float, kRenderQuantumFrames> frequencyValues_{};
};

class OfflineBufferSourceNode final : public BufferSourceNode, public RenderNode {
public:
    explicit OfflineBufferSourceNode(std::shared_ptr<const RenderClock> clock) noexcept;

    void connect(AudioNode& destination) override;
    void start(double when) override;
    void stop(double when) override;
    void setBuffer(std::shared_ptr<const AudioBuffer> buffer) override;
    [[nodiscard]] bool acceptsInput() const noexcept override { return false; }

protected:
    void renderQuantum(float* output, size_t numFrames) override;
    [[nodiscard]] bool hasFinished(double quantumEndTime) const noexcept override;

private:
    std::shared_ptr<const AudioBuffer> buffer_;
    SourceSchedule schedule_;
};

class OfflineBiquadFilterNode final : public BiquadFilterNode, public RenderNode {
public:
    explicit OfflineBiquadFilterNode(std::shared_ptr<const RenderClock> clock);

    void connect(AudioNode& destination) override;
    void setType(FilterType type) override { type_ = type; }
    [[nodiscard]] FilterType type() const override { return type_; }
    [[nodiscard]] AudioParam& frequency() override { return frequency_; }
    [[nodiscard]] AudioParam& q() override { return q_; }

protected:
    void renderQuantum(float* output, size_t numFrames) override;

private:
    ScheduledParam frequency_;
    ScheduledParam q_;
    BiquadFilter filter_;
    FilterType type_ = FilterType::Lowpass;
};

} // namespace detail
} // namespace Sfx
} // namespace Bleep
