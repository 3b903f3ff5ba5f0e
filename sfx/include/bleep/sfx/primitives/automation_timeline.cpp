// ==============================================================================
// Automation Timeline Implementation
// ==============================================================================

#include "automation_timeline.h"

#include <bleep/sfx/core/float_checks.h>

#include <algorithm>
#include <cmath>
#include <iterator>

namespace Bleep {
namespace Sfx {

namespace {

[[nodiscard]] bool isRamp(AutomationEventType type) noexcept {
    return type == AutomationEventType::LinearRamp ||
           type == AutomationEventType::ExponentialRamp;
}

[[nodiscard]] double sanitizeTime(double time) noexcept {
    return time < 0.0 ? 0.0 : time;
}

[[nodiscard]] float interpolateRamp(
    AutomationEventType type,
    double t0, float v0,
    double t1, float v1,
    double time
) noexcept {
    if (t1 <= t0) {
        return v1;
    }
    const double ratio = (time - t0) / (t1 - t0);

    if (type == AutomationEventType::LinearRamp) {
        return static_cast<float>(v0 + (v1 - v0) * ratio);
    }

    // Geometric interpolation is only defined between same-sign, non-zero endpoints
    if (v0 == 0.0f || v1 == 0.0f || (v0 < 0.0f) != (v1 < 0.0f)) {
        return v0;
    }
    return static_cast<float>(v0 * std::pow(static_cast<double>(v1) / v0, ratio));
}

[[nodiscard]] float targetCurve(float v0, const AutomationEvent& event, double time) noexcept {
    const double elapsed = time - event.time;
    const double decay = std::exp(-elapsed / event.timeConstant);
    return static_cast<float>(event.value + (v0 - event.value) * decay);
}

} // namespace

AutomationTimeline::AutomationTimeline(float intrinsicValue) noexcept
    : intrinsic_(detail::isFinite(intrinsicValue) ? intrinsicValue : 0.0f) {}

void AutomationTimeline::setIntrinsicValue(float value) noexcept {
    if (detail::isFinite(value)) {
        intrinsic_ = value;
    }
}

bool AutomationTimeline::setValueAtTime(float value, double time) {
    if (!detail::isFinite(value) || !detail::isFinite(time)) {
        return false;
    }
    insert({AutomationEventType::SetValue, sanitizeTime(time), value, 0.0});
    return true;
}

bool AutomationTimeline::linearRampToValueAtTime(float value, double endTime) {
    if (!detail::isFinite(value) || !detail::isFinite(endTime)) {
        return false;
    }
    insert({AutomationEventType::LinearRamp, sanitizeTime(endTime), value, 0.0});
    return true;
}

bool AutomationTimeline::exponentialRampToValueAtTime(float value, double endTime) {
    if (!detail::isFinite(value) || !detail::isFinite(endTime)) {
        return false;
    }
    insert({AutomationEventType::ExponentialRamp, sanitizeTime(endTime), value, 0.0});
    return true;
}

bool AutomationTimeline::setTargetAtTime(float target, double startTime, double timeConstant) {
    if (!detail::isFinite(target) || !detail::isFinite(startTime) || !detail::isFinite(timeConstant)) {
        return false;
    }
    if (timeConstant <= 0.0) {
        return setValueAtTime(target, startTime);
    }
    insert({AutomationEventType::SetTarget, sanitizeTime(startTime), target, timeConstant});
    return true;
}

void AutomationTimeline::cancelScheduledValues(double startTime) noexcept {
    if (!detail::isFinite(startTime)) {
        return;
    }
    const auto first = std::find_if(events_.begin(), events_.end(),
        [startTime](const AutomationEvent& e) { return e.time >= startTime; });
    events_.erase(first, events_.end());
}

void AutomationTimeline::discardBefore(double time) noexcept {
    if (!detail::isFinite(time)) {
        return;
    }
    const auto later = std::upper_bound(events_.begin(), events_.end(), time,
        [](double t, const AutomationEvent& e) { return t < e.time; });
    if (later == events_.begin()) {
        return;
    }
    const auto active = std::prev(later);
    if (active == events_.begin()) {
        return;
    }

    if (active->type != AutomationEventType::SetTarget) {
        // A finished ramp or a step does not depend on what came before it
        events_.erase(events_.begin(), active);
        return;
    }

    // The curve starts from the value reached when the target begins
    const auto anchor = std::prev(active);
    const float start = valueAt(active->time);
    *anchor = AutomationEvent{AutomationEventType::SetValue, active->time, start, 0.0};
    events_.erase(events_.begin(), anchor);
}

void AutomationTimeline::insert(const AutomationEvent& event) {
    const auto pos = std::upper_bound(events_.begin(), events_.end(), event.time,
        [](double time, const AutomationEvent& e) { return time < e.time; });
    events_.insert(pos, event);
}

float AutomationTimeline::valueAt(double time) const noexcept {
    float value = intrinsic_;
    double prevTime = 0.0;

    const size_t count = events_.size();
    for (size_t i = 0; i < count; ++i) {
        const AutomationEvent& event = events_[i];

        switch (event.type) {
            case AutomationEventType::LinearRamp:
            case AutomationEventType::ExponentialRamp:
                if (time < event.time) {
                    return interpolateRamp(event.type, prevTime, value, event.time, event.value, time);
                }
                value = event.value;
                prevTime = event.time;
                break;

            case AutomationEventType::SetValue:
                if (time < event.time) {
                    return value;
                }
                value = event.value;
                prevTime = event.time;
                break;

            case AutomationEventType::SetTarget: {
                if (time < event.time) {
                    return value;
                }
                const float v0 = value;
                if (i + 1 < count) {
                    const AutomationEvent& next = events_[i + 1];
                    if (isRamp(next.type)) {
                        // The ramp takes over from the curve's starting point
                        prevTime = event.time;
                        break;
                    }
                    if (next.time <= time) {
                        value = targetCurve(v0, event, next.time);
                        prevTime = next.time;
                        break;
                    }
                }
                return targetCurve(v0, event, time);
            }
        }
    }
    return value;
}

void AutomationTimeline::fill(
    size_t startFrame,
    double sampleRate,
    float* output,
    size_t numSamples
) const noexcept {
    if (events_.empty() || !(sampleRate > 0.0)) {
        std::fill(output, output + numSamples, events_.empty() ? intrinsic_ : valueAt(0.0));
        return;
    }
    for (size_t i = 0; i < numSamples; ++i) {
        output[i] = valueAt(static_cast<double>(startFrame + i) / sampleRate);
    }
}

} // namespace Sfx
} // namespace Bleep
