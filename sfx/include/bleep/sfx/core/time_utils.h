// ==============================================================================
// Layer 0: Core Utility - Time Conversion
// ==============================================================================
// Seconds <-> frame conversion with saturation for non-finite and
// out-of-range values. Schedules are expressed in context seconds; the
// renderer works in frames.
// ==============================================================================

#pragma once

#include <bleep/sfx/core/float_checks.h>

#include <cmath>
#include <cstddef>
#include <limits>

namespace Bleep {
namespace Sfx {

/// @brief Convert seconds to a frame count, rounding down.
/// @return 0 for non-positive input or invalid sample rate; saturates at SIZE_MAX
[[nodiscard]] inline size_t secondsToFrames(double seconds, double sampleRate) noexcept {
    if (!(sampleRate > 0.0)) {
        return 0;
    }
    if (!detail::isFinite(seconds)) {
        return seconds > 0.0 ? std::numeric_limits<size_t>::max() : 0;
    }
    if (seconds <= 0.0) {
        return 0;
    }
    const double maxSeconds = static_cast<double>(std::numeric_limits<size_t>::max()) / sampleRate;
    if (seconds >= maxSeconds) {
        return std::numeric_limits<size_t>::max();
    }
    return static_cast<size_t>(seconds * sampleRate);
}

/// @brief Convert a frame position to seconds.
[[nodiscard]] constexpr double framesToSeconds(size_t frames, double sampleRate) noexcept {
    return (sampleRate > 0.0) ? static_cast<double>(frames) / sampleRate : 0.0;
}

} // namespace Sfx
} // namespace Bleep
