// ==============================================================================
// Offline Render Nodes Implementation
// ==============================================================================

#include "offline_nodes.h"

#include <bleep/sfx/core/float_checks.h>
#include <bleep/sfx/core/logging.h>

#include <algorithm>
#include <utility>

namespace Bleep {
namespace Sfx {
namespace detail {

namespace {

constexpr float kDefaultGain = 1.0f;
constexpr float kDefaultOscillatorFrequency = 440.0f;
constexpr float kDefaultFilterFrequency = 350.0f;
constexpr float kDefaultFilterQ = 1.0f;

constexpr float kParamLowest = std::numeric_limits<float>::lowest();
constexpr float kParamHighest = std::numeric_limits<float>::max();

/// Start/stop times arrive from game code; keep them finite and non-negative.
[[nodiscard]] double sanitizeWhen(double when) noexcept {
    return (detail::isFinite(when) && when > 0.0) ? when : 0.0;
}

void warnRejected(const char* call, float value) {
    BLEEP_SFX_LOG_WARN("AudioParam::%s ignored non-finite value %f", call, static_cast<double>(value));
}

} // namespace

// =============================================================================
// ScheduledParam
// =============================================================================

ScheduledParam::ScheduledParam(std::shared_ptr<const RenderClock> clock,
                               float defaultValue,
                               float minValue,
                               float maxValue)
    : clock_(std::move(clock))
    , timeline_(defaultValue)
    , minValue_(minValue)
    , maxValue_(maxValue) {}

void ScheduledParam::setValue(float value) {
    if (!detail::isFinite(value)) {
        warnRejected("setValue", value);
        return;
    }
    timeline_.setIntrinsicValue(value);
    if (!timeline_.empty()) {
        (void)timeline_.setValueAtTime(value, clock_->currentTime());
    }
}

float ScheduledParam::value() const {
    return valueAt(clock_->currentTime());
}

void ScheduledParam::setValueAtTime(float value, double time) {
    if (!timeline_.setValueAtTime(value, time)) {
        warnRejected("setValueAtTime", value);
    }
}

void ScheduledParam::linearRampToValueAtTime(float value, double endTime) {
    if (!timeline_.linearRampToValueAtTime(value, endTime)) {
        warnRejected("linearRampToValueAtTime", value);
    }
}

void ScheduledParam::exponentialRampToValueAtTime(float value, double endTime) {
    if (value == 0.0f) {
        BLEEP_SFX_LOG_DEBUG("exponential ramp to 0 holds the previous value");
    }
    if (!timeline_.exponentialRampToValueAtTime(value, endTime)) {
        warnRejected("exponentialRampToValueAtTime", value);
    }
}

void ScheduledParam::setTargetAtTime(float target, double startTime, double timeConstant) {
    if (!timeline_.setTargetAtTime(target, startTime, timeConstant)) {
        warnRejected("setTargetAtTime", target);
    }
}

void ScheduledParam::cancelScheduledValues(double startTime) {
    timeline_.cancelScheduledValues(startTime);
}

void ScheduledParam::fillQuantum(float* output, size_t numFrames) noexcept {
    timeline_.discardBefore(clock_->currentTime());
    timeline_.fill(clock_->framesRendered, clock_->sampleRate, output, numFrames);
    for (size_t i = 0; i < numFrames; ++i) {
        output[i] = std::clamp(output[i], minValue_, maxValue_);
    }
}

float ScheduledParam::quantumValue() noexcept {
    const double now = clock_->currentTime();
    timeline_.discardBefore(now);
    return valueAt(now);
}

float ScheduledParam::valueAt(double time) const noexcept {
    return std::clamp(timeline_.valueAt(time), minValue_, maxValue_);
}

// =============================================================================
// RenderNode
// =============================================================================

RenderNode::RenderNode(std::shared_ptr<const RenderClock> clock) noexcept
    : clock_(std::move(clock)) {}

const float* RenderNode::pull() {
    if (renderedQuantum_ != clock_->quantumIndex) {
        renderedQuantum_ = clock_->quantumIndex;
        renderQuantum(buffer_.data(), std::min(clock_->quantumFrames, kRenderQuantumFrames));
    }
    return buffer_.data();
}

bool RenderNode::addInput(const std::shared_ptr<RenderNode>& input) {
    if (!input || !acceptsInput() || input.get() == this || input->isFedBy(this)) {
        return false;
    }
    if (std::find(inputs_.begin(), inputs_.end(), input) != inputs_.end()) {
        return true;  // repeated connect is a no-op
    }
    inputs_.push_back(input);
    ++input->graphRefs_;
    hadInput_ = true;
    return true;
}

void RenderNode::prune(double quantumEndTime) {
    for (const auto& input : inputs_) {
        input->prune(quantumEndTime);
    }
    inputs_.erase(
        std::remove_if(inputs_.begin(), inputs_.end(),
            [quantumEndTime](const std::shared_ptr<RenderNode>& input) {
                if (!input->hasFinished(quantumEndTime)) {
                    return false;
                }
                --input->graphRefs_;
                return true;
            }),
        inputs_.end());
}

bool RenderNode::isFedBy(const RenderNode* node) const {
    for (const auto& input : inputs_) {
        if (input.get() == node || input->isFedBy(node)) {
            return true;
        }
    }
    return false;
}

void RenderNode::collectUpstream(std::unordered_set<const RenderNode*>& seen) const {
    for (const auto& input : inputs_) {
        if (seen.insert(input.get()).second) {
            input->collectUpstream(seen);
        }
    }
}

bool RenderNode::hasFinished(double /*quantumEndTime*/) const noexcept {
    // Processing node: drained of inputs and held by nobody but the graph
    return hadInput_ && inputs_.empty() &&
           static_cast<size_t>(weak_from_this().use_count()) == graphRefs_;
}

void RenderNode::sumInputs(float* output, size_t numFrames) {
    std::fill(output, output + numFrames, 0.0f);
    for (const auto& input : inputs_) {
        const float* samples = input->pull();
        for (size_t i = 0; i < numFrames; ++i) {
            output[i] += samples[i];
        }
    }
}

void RenderNode::connectTo(AudioNode& destination) {
    auto* target = dynamic_cast<RenderNode*>(&destination);
    if (target == nullptr || target->clockId() != clockId()) {
        BLEEP_SFX_LOG_WARN("connect rejected: destination belongs to another context");
        return;
    }
    if (!target->acceptsInput()) {
        BLEEP_SFX_LOG_WARN("connect rejected: destination is a source node");
        return;
    }
    if (target == this || isFedBy(target)) {
        BLEEP_SFX_LOG_WARN("connect rejected: connection would create a cycle");
        return;
    }
    (void)target->addInput(shared_from_this());
}

// =============================================================================
// OfflineDestinationNode
// =============================================================================

OfflineDestinationNode::OfflineDestinationNode(std::shared_ptr<const RenderClock> clock) noexcept
    : RenderNode(std::move(clock)) {}

void OfflineDestinationNode::connect(AudioNode& /*destination*/) {
    BLEEP_SFX_LOG_WARN("connect rejected: the destination has no output");
}

void OfflineDestinationNode::renderQuantum(float* output, size_t numFrames) {
    sumInputs(output, numFrames);
}

// =============================================================================
// OfflineGainNode
// =============================================================================

OfflineGainNode::OfflineGainNode(std::shared_ptr<const RenderClock> clock)
    : RenderNode(clock)
    , gain_(clock, kDefaultGain, kParamLowest, kParamHighest) {}

void OfflineGainNode::connect(AudioNode& destination) {
    connectTo(destination);
}

void OfflineGainNode::renderQuantum(float* output, size_t numFrames) {
    sumInputs(output, numFrames);
    gain_.fillQuantum(gainValues_.data(), numFrames);
    for (size_t i = 0; i < numFrames; ++i) {
        output[i] *= gainValues_[i];
    }
}

// =============================================================================
// OfflineOscillatorNode
// =============================================================================

OfflineOscillatorNode::OfflineOscillatorNode(std::shared_ptr<const RenderClock> clock)
    : RenderNode(clock)
    , frequency_(clock,
                 kDefaultOscillatorFrequency,
                 static_cast<float>(-clock->sampleRate * 0.5),
                 static_cast<float>(clock->sampleRate * 0.5))
    , oscillator_(clock->sampleRate) {}

void OfflineOscillatorNode::connect(AudioNode& destination) {
    connectTo(destination);
}

void OfflineOscillatorNode::start(double when) {
    if (schedule_.started()) {
        BLEEP_SFX_LOG_WARN("oscillator start() called twice; ignored");
        return;
    }
    schedule_.startTime = sanitizeWhen(when);
}

void OfflineOscillatorNode::stop(double when) {
    if (!schedule_.started()) {
        BLEEP_SFX_LOG_WARN("oscillator stop() before start(); ignored");
        return;
    }
    schedule_.stopTime = sanitizeWhen(when);
}

void OfflineOscillatorNode::setType(OscWaveform type) {
    oscillator_.setWaveform(type);
}

void OfflineOscillatorNode::renderQuantum(float* output, size_t numFrames) {
    frequency_.fillQuantum(frequencyValues_.data(), numFrames);

    for (size_t i = 0; i < numFrames; ++i) {
        if (!schedule_.isActiveAt(clock_->timeAt(i))) {
            output[i] = 0.0f;
            continue;
        }
        output[i] = oscillator_.next(frequencyValues_[i]);
    }
}

bool OfflineOscillatorNode::hasFinished(double quantumEndTime) const noexcept {
    return schedule_.started() && schedule_.stopTime >= 0.0 && schedule_.stopTime <= quantumEndTime;
}

// =============================================================================
// OfflineBufferSourceNode
// =============================================================================

OfflineBufferSourceNode::OfflineBufferSourceNode(std::shared_ptr<const RenderClock> clock) noexcept
    : RenderNode(std::move(clock)) {}

void OfflineBufferSourceNode::connect(AudioNode& destination) {
    connectTo(destination);
}

void OfflineBufferSourceNode::start(double when) {
    if (schedule_.started()) {
        BLEEP_SFX_LOG_WARN("buffer source start() called twice; ignored");
        return;
    }
    schedule_.startTime = sanitizeWhen(when);
}

void OfflineBufferSourceNode::stop(double when) {
    if (!schedule_.started()) {
        BLEEP_SFX_LOG_WARN("buffer source stop() before start(); ignored");
        return;
    }
    schedule_.stopTime = sanitizeWhen(when);
}

void OfflineBufferSourceNode::setBuffer(std::shared_ptr<const AudioBuffer> buffer) {
    buffer_ = std::move(buffer);
}

void OfflineBufferSourceNode::renderQuantum(float* output, size_t numFrames) {
    const float* samples = buffer_ ? buffer_->channelData(0) : nullptr;
    if (samples == nullptr) {
        std::fill(output, output + numFrames, 0.0f);
        return;
    }

    const double bufferRate = static_cast<double>(buffer_->sampleRate());
    const size_t length = buffer_->length();

    for (size_t i = 0; i < numFrames; ++i) {
        const double time = clock_->timeAt(i);
        if (!schedule_.isActiveAt(time)) {
            output[i] = 0.0f;
            continue;
        }
        // Nearest-lower sample; tolerance absorbs rounding at frame-aligned start times
        const auto index = static_cast<size_t>((time - schedule_.startTime) * bufferRate + 1e-6);
        output[i] = (index < length) ? samples[index] : 0.0f;
    }
}

bool OfflineBufferSourceNode::hasFinished(double quantumEndTime) const noexcept {
    if (!schedule_.started()) {
        return false;
    }
    if (schedule_.stopTime >= 0.0 && schedule_.stopTime <= quantumEndTime) {
        return true;
    }
    return buffer_ && schedule_.startTime + buffer_->duration() <= quantumEndTime;
}

// =============================================================================
// OfflineBiquadFilterNode
// =============================================================================

OfflineBiquadFilterNode::OfflineBiquadFilterNode(std::shared_ptr<const RenderClock> clock)
    : RenderNode(clock)
    , frequency_(clock, kDefaultFilterFrequency, 0.0f, static_cast<float>(clock->sampleRate * 0.5))
    , q_(clock, kDefaultFilterQ, kParamLowest, kParamHighest) {}

void OfflineBiquadFilterNode::connect(AudioNode& destination) {
    connectTo(destination);
}

void OfflineBiquadFilterNode::renderQuantum(float* output, size_t numFrames) {
    sumInputs(output, numFrames);

    // Coefficients follow the parameters once per quantum (k-rate)
    filter_.setResponse(type_, frequency_.quantumValue(), q_.quantumValue(),
                        static_cast<float>(clock_->sampleRate));
    filter_.process(output, numFrames);
}

} // namespace detail
} // namespace Sfx
} // namespace Bleep
