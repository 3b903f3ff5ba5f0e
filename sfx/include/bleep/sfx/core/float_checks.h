// ==============================================================================
// Layer 0: Core Utility - Float Classification
// ==============================================================================
// Bit-level NaN/Inf checks that keep working under -ffast-math / /fp:fast,
// plus denormal flushing for recursive filters.
// ==============================================================================

#pragma once

#include <bit>
#include <cmath>
#include <cstdint>

namespace Bleep {
namespace Sfx {

/// Threshold below which recursive state is flushed to zero (denormal prevention)
inline constexpr float kDenormalThreshold = 1e-15f;

namespace detail {

/// @brief NaN check via bit pattern (exponent all ones, mantissa non-zero).
[[nodiscard]] constexpr bool isNaN(float x) noexcept {
    const auto bits = std::bit_cast<std::uint32_t>(x);
    return ((bits & 0x7F800000u) == 0x7F800000u) && ((bits & 0x007FFFFFu) != 0);
}

/// @brief Infinity check via bit pattern (exponent all ones, mantissa zero).
[[nodiscard]] constexpr bool isInf(float x) noexcept {
    const auto bits = std::bit_cast<std::uint32_t>(x);
    return (bits & 0x7FFFFFFFu) == 0x7F800000u;
}

/// @brief True for any value that is neither NaN nor infinite.
[[nodiscard]] constexpr bool isFinite(float x) noexcept {
    const auto bits = std::bit_cast<std::uint32_t>(x);
    return (bits & 0x7F800000u) != 0x7F800000u;
}

/// @brief Double-precision finiteness check for times and durations.
[[nodiscard]] constexpr bool isFinite(double x) noexcept {
    const auto bits = std::bit_cast<std::uint64_t>(x);
    return (bits & 0x7FF0000000000000ull) != 0x7FF0000000000000ull;
}

/// @brief Flush denormal values to zero.
[[nodiscard]] inline float flushDenormal(float x) noexcept {
    return (std::abs(x) < kDenormalThreshold) ? 0.0f : x;
}

} // namespace detail

} // namespace Sfx
} // namespace Bleep
