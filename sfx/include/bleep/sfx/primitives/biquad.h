// ==============================================================================
// Layer 1: Primitive - Biquad Filter
// ==============================================================================
// Second-order filter behind the offline filter node. The node sets the
// response once per render quantum (k-rate) and filters the quantum in place;
// coefficients are recomputed only when the response actually changes.
//
// Coefficients follow the RBJ Audio EQ Cookbook; the filter runs in
// transposed direct form II.
// ==============================================================================

#pragma once

#include <bleep/sfx/core/float_checks.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>

namespace Bleep {
namespace Sfx {

/// @brief Filter responses, shared with the host graph interface.
enum class FilterType : uint8_t {
    Lowpass,   ///< 12 dB/oct above the cutoff
    Bandpass   ///< 0 dB at the centre frequency, Q sets the width
};

class BiquadFilter {
public:
    /// @brief Select the response used by the next process() call.
    ///
    /// Frequency is clamped into the audible band below Nyquist and Q into
    /// [0.1, 30]; NaN falls back to 1 kHz and Q 1. A non-positive or
    /// non-finite sample rate turns the filter into a pass-through.
    void setResponse(FilterType type, float frequency, float q, float sampleRate) noexcept {
        const Response next{type, frequency, q, sampleRate};
        if (hasCoefficients_ && next == response_) {
            return;
        }
        response_ = next;
        hasCoefficients_ = true;
        computeCoefficients();
    }

    /// @brief Filter count samples in place. A non-finite sample clears the
    /// filter state and comes out as 0.
    void process(float* samples, size_t count) noexcept {
        for (size_t i = 0; i < count; ++i) {
            const float in = samples[i];
            if (!detail::isFinite(in)) {
                reset();
                samples[i] = 0.0f;
                continue;
            }
            const float out = b0_ * in + s1_;
            s1_ = detail::flushDenormal(b1_ * in - a1_ * out + s2_);
            s2_ = detail::flushDenormal(b2_ * in - a2_ * out);
            samples[i] = out;
        }
    }

    void reset() noexcept {
        s1_ = 0.0f;
        s2_ = 0.0f;
    }

private:
    struct Response {
        FilterType type;
        float frequency;
        float q;
        float sampleRate;

        bool operator==(const Response&) const = default;
    };

    void computeCoefficients() noexcept {
        const double rate = response_.sampleRate;
        if (!detail::isFinite(response_.sampleRate) || !(rate > 0.0)) {
            b0_ = 1.0f;
            b1_ = b2_ = a1_ = a2_ = 0.0f;
            return;
        }

        const double frequency = detail::isNaN(response_.frequency)
            ? 1000.0
            : std::min(std::max(static_cast<double>(response_.frequency), 10.0), rate * 0.49);
        const double q = detail::isNaN(response_.q)
            ? 1.0
            : std::clamp(static_cast<double>(response_.q), 0.1, 30.0);

        const double w = 6.283185307179586 * frequency / rate;
        const double cosW = std::cos(w);
        const double alpha = std::sin(w) / (2.0 * q);
        const double norm = 1.0 / (1.0 + alpha);

        double b0 = 0.0;
        double b1 = 0.0;
        double b2 = 0.0;
        if (response_.type == FilterType::Lowpass) {
            b1 = 1.0 - cosW;
            b0 = b2 = 0.5 * b1;
        } else {
            b0 = alpha;
            b2 = -alpha;
        }

        b0_ = static_cast<float>(b0 * norm);
        b1_ = static_cast<float>(b1 * norm);
        b2_ = static_cast<float>(b2 * norm);
        a1_ = static_cast<float>(-2.0 * cosW * norm);
        a2_ = static_cast<float>((1.0 - alpha) * norm);
    }

    Response response_{FilterType::Lowpass, 0.0f, 0.0f, 0.0f};
    bool hasCoefficients_ = false;
    float b0_ = 1.0f;
    float b1_ = 0.0f;
    float b2_ = 0.0f;
    float a1_ = 0.0f;
    float a2_ = 0.0f;
    float s1_ = 0.0f;
    float s2_ = 0.0f;
};

} // namespace Sfx
} // namespace Bleep
