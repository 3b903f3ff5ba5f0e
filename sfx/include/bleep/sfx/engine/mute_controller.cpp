// ==============================================================================
// Mute Controller Implementation
// ==============================================================================

#include "mute_controller.h"

#include <bleep/sfx/core/float_checks.h>

#include <algorithm>

namespace Bleep {
namespace Sfx {

MuteController::MuteController(double timeConstantSeconds, float masterVolume) noexcept
    : timeConstant_((detail::isFinite(timeConstantSeconds) && timeConstantSeconds > 0.0)
                        ? timeConstantSeconds
                        : kDefaultMuteTimeConstant)
    , volume_(detail::isNaN(masterVolume) ? 1.0f : std::clamp(masterVolume, 0.0f, 1.0f)) {}

bool MuteController::setMasterVolume(float volume) noexcept {
    if (detail::isNaN(volume)) {
        return false;
    }
    volume_ = std::clamp(volume, 0.0f, 1.0f);
    return true;
}

void MuteController::applyTo(AudioParam& masterGain, double now) const {
    masterGain.setTargetAtTime(targetGain(), now, timeConstant_);
}

} // namespace Sfx
} // namespace Bleep
