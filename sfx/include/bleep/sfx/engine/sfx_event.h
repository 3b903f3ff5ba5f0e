// ==============================================================================
// Layer 3: Engine - Cue Identifiers
// ==============================================================================

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace Bleep {
namespace Sfx {

/// @brief Game events that have a sound cue.
enum class SfxEvent : uint8_t {
    Rotate,
    HardDrop,
    LineClear,
    Combo67,
    LevelUp,
    GameOver
};

inline constexpr size_t kNumSfxEvents = 6;

inline constexpr std::array<SfxEvent, kNumSfxEvents> kAllSfxEvents = {
    SfxEvent::Rotate,
    SfxEvent::HardDrop,
    SfxEvent::LineClear,
    SfxEvent::Combo67,
    SfxEvent::LevelUp,
    SfxEvent::GameOver
};

/// @brief Per-call cue arguments. Out-of-range values are clamped by the recipes.
struct EffectParams {
    int level = 1;      ///< Game level (pitch scaling)
    int lineCount = 1;  ///< Rows cleared (LineClear only)
};

/// @brief Stable lowercase name, usable as a file stem.
[[nodiscard]] constexpr const char* sfxEventName(SfxEvent event) noexcept {
    switch (event) {
        case SfxEvent::Rotate:    return "rotate";
        case SfxEvent::HardDrop:  return "hard_drop";
        case SfxEvent::LineClear: return "line_clear";
        case SfxEvent::Combo67:   return "combo67";
        case SfxEvent::LevelUp:   return "level_up";
        case SfxEvent::GameOver:  return "game_over";
    }
    return "unknown";
}

} // namespace Sfx
} // namespace Bleep
