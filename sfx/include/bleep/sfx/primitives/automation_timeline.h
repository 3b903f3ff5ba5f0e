// ==============================================================================
// Layer 1: Primitive - Automation Timeline
// ==============================================================================
// Time-stamped parameter automation: the value curve behind every scheduled
// parameter (gain envelopes, frequency sweeps, master mute ramps).
//
// Event semantics:
// - SetValue:        jump to value at time
// - LinearRamp:      straight line from the previous event to (time, value)
// - ExponentialRamp: geometric curve from the previous event to (time, value);
//                    endpoints of zero or opposite sign hold the previous
//                    value until the end time
// - SetTarget:       v(t) = target + (v0 - target) * exp(-(t - t0) / tau),
//                    running until the next event. A following SetValue or
//                    SetTarget starts from the curve's value at its own time;
//                    a following ramp interpolates from the curve's start.
//
// Before the first event the intrinsic value applies. Events are kept sorted
// by time; events sharing a time keep insertion order.
//
// Scheduling allocates (control thread). valueAt()/fill() are real-time safe.
// ==============================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace Bleep {
namespace Sfx {

/// @brief Kind of automation event.
enum class AutomationEventType : uint8_t {
    SetValue,
    LinearRamp,
    ExponentialRamp,
    SetTarget
};

/// @brief One scheduled automation command.
struct AutomationEvent {
    AutomationEventType type = AutomationEventType::SetValue;
    double time = 0.0;          ///< Event time (ramp end time for ramps), seconds
    float value = 0.0f;         ///< Target value
    double timeConstant = 0.0;  ///< SetTarget only, seconds
};

/// @brief Sorted list of automation events evaluated at arbitrary times.
class AutomationTimeline {
public:
    explicit AutomationTimeline(float intrinsicValue = 0.0f) noexcept;

    // =========================================================================
    // Intrinsic Value
    // =========================================================================

    /// @brief Value used before the first event. NaN/Inf are ignored.
    void setIntrinsicValue(float value) noexcept;
    [[nodiscard]] float intrinsicValue() const noexcept { return intrinsic_; }

    // =========================================================================
    // Scheduling
    // =========================================================================
    // Each call returns false (and schedules nothing) for non-finite input.
    // Negative times are clamped to 0.

    bool setValueAtTime(float value, double time);
    bool linearRampToValueAtTime(float value, double endTime);
    bool exponentialRampToValueAtTime(float value, double endTime);

    /// @brief Exponential approach toward target starting at startTime.
    /// A non-positive time constant degenerates to setValueAtTime(target, startTime).
    bool setTargetAtTime(float target, double startTime, double timeConstant);

    /// @brief Remove all events at or after startTime.
    void cancelScheduledValues(double startTime) noexcept;

    /// @brief Remove all events.
    void clear() noexcept { events_.clear(); }

    /// @brief Drop events that no longer shape the curve at or after time.
    ///
    /// The event in effect at time is kept, preceded by a SetValue anchor
    /// holding its start value when it is a SetTarget. Values before time are
    /// not preserved. Keeps a long-lived curve at a bounded size.
    void discardBefore(double time) noexcept;

    // =========================================================================
    // Evaluation
    // =========================================================================

    /// @brief Automation value at an absolute time.
    [[nodiscard]] float valueAt(double time) const noexcept;

    /// @brief Fill numSamples per-sample values starting at frame startFrame.
    ///
    /// Sample i is evaluated at (startFrame + i) / sampleRate, so splitting a
    /// range into several calls gives identical results.
    void fill(size_t startFrame, double sampleRate, float* output, size_t numSamples) const noexcept;

    [[nodiscard]] const std::vector<AutomationEvent>& events() const noexcept { return events_; }
    [[nodiscard]] bool empty() const noexcept { return events_.empty(); }

private:
    void insert(const AutomationEvent& event);

    std::vector<AutomationEvent> events_;
    float intrinsic_;
};

} // namespace Sfx
} // namespace Bleep
