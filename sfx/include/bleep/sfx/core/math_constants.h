// ==============================================================================
// Layer 0: Core Utility - Math Constants
// ==============================================================================
// Centralized mathematical constants for synthesis calculations.
// All components should import these constants instead of defining locally.
//
// Note: Constants are inline constexpr to ensure a single definition across
// all translation units.
// ==============================================================================

#pragma once

namespace Bleep {
namespace Sfx {

/// Pi constant, full float precision: 3.14159265358979323846
inline constexpr float kPi = 3.14159265358979323846f;

/// Two times Pi (full circle in radians)
/// Used for angular frequency calculations: omega = kTwoPi * f / fs
inline constexpr float kTwoPi = 2.0f * kPi;

/// Smallest magnitude an exponential ramp may target.
/// Exponential approach to exactly zero is undefined, so envelopes decay to this floor.
inline constexpr float kEnvelopeFloor = 0.001f;

} // namespace Sfx
} // namespace Bleep
