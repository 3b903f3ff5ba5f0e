// ==============================================================================
// Layer 1: Primitive - Tone Oscillator
// ==============================================================================
// Per-sample periodic source behind the offline oscillator node. The node
// evaluates its frequency parameter at audio rate, so the frequency is an
// argument of every sample rather than oscillator state.
//
// Square and sawtooth steps are smoothed with a two-sample polynomial
// residual (PolyBLEP). The triangle has no steps and is generated directly.
// ==============================================================================

#pragma once

#include <bleep/sfx/core/float_checks.h>

#include <cmath>
#include <cstdint>

namespace Bleep {
namespace Sfx {

/// @brief Periodic waveform shapes, shared with the host graph interface.
enum class OscWaveform : uint8_t {
    Sine,
    Square,
    Sawtooth,
    Triangle
};

class ToneOscillator {
public:
    /// @param sampleRate Hz; a non-positive rate produces silence
    explicit ToneOscillator(double sampleRate) noexcept
        : sampleRate_(sampleRate > 0.0 ? sampleRate : 0.0) {}

    void setWaveform(OscWaveform waveform) noexcept { waveform_ = waveform; }
    [[nodiscard]] OscWaveform waveform() const noexcept { return waveform_; }

    /// @brief Produce one sample and advance the phase.
    /// @param frequency Hz, clamped to [0, Nyquist); NaN and Inf count as 0
    /// @return Sample in [-1, 1]
    [[nodiscard]] float next(float frequency) noexcept {
        const double dt = phaseIncrement(frequency);
        const double t = phase_;

        double out = 0.0;
        switch (waveform_) {
            case OscWaveform::Sine:
                out = std::sin(kCycle * t);
                break;
            case OscWaveform::Square:
                out = (t < 0.5 ? 1.0 : -1.0) + stepResidual(t, dt) - stepResidual(shifted(t, 0.5), dt);
                break;
            case OscWaveform::Sawtooth:
                out = 2.0 * t - 1.0 - stepResidual(t, dt);
                break;
            case OscWaveform::Triangle:
                // Starts at 0 and rises, peaking a quarter cycle in
                out = 1.0 - 4.0 * std::abs(shifted(t, 0.25) - 0.5);
                break;
        }

        phase_ = shifted(t, dt);
        return static_cast<float>(out);
    }

    /// @brief Restart at phase 0.
    void reset() noexcept { phase_ = 0.0; }

private:
    static constexpr double kCycle = 6.283185307179586;

    [[nodiscard]] double phaseIncrement(float frequency) const noexcept {
        if (sampleRate_ == 0.0 || !detail::isFinite(frequency) || frequency <= 0.0f) {
            return 0.0;
        }
        // Strictly below Nyquist keeps dt < 0.5, which stepResidual requires
        const double dt = static_cast<double>(frequency) / sampleRate_;
        return dt < 0.5 ? dt : 0.4999;
    }

    /// Phase moved forward by offset in [0, 1), wrapped to [0, 1)
    [[nodiscard]] static double shifted(double t, double offset) noexcept {
        const double moved = t + offset;
        return moved >= 1.0 ? moved - 1.0 : moved;
    }

    /// Correction for a step from -1 to +1 at phase 0, spread over one sample either side
    [[nodiscard]] static double stepResidual(double t, double dt) noexcept {
        if (dt <= 0.0) {
            return 0.0;
        }
        if (t < dt) {
            const double x = t / dt - 1.0;
            return -x * x;
        }
        if (t > 1.0 - dt) {
            const double x = (t - 1.0) / dt + 1.0;
            return x * x;
        }
        return 0.0;
    }

    double sampleRate_;
    double phase_ = 0.0;
    OscWaveform waveform_ = OscWaveform::Sine;
};

} // namespace Sfx
} // namespace Bleep
