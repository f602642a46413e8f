/// @file types.hpp
/// @brief Core types for fold_anim module

#pragma once

#include "fwd.hpp"

#include <cstdint>
#include <functional>

namespace fold_anim {

// =============================================================================
// Constants
// =============================================================================

/// Default duration of theme-driven transitions, in seconds
inline constexpr float kThemeAnimationDuration = 0.2f;

// =============================================================================
// Animation Enums
// =============================================================================

/// @brief Status of an animation clock
enum class AnimationStatus : std::uint8_t {
    Idle,       ///< Stopped at the beginning (value 0)
    Forward,    ///< Running, or last run, towards 1
    Reverse,    ///< Running, or last run, towards 0
    Completed   ///< Stopped at the end (value 1)
};

/// @brief Direction of the most recent run
enum class AnimationDirection : std::uint8_t {
    Forward,
    Reverse
};

/// @brief Named easing functions backed by Easing
enum class EasingType : std::uint8_t {
    Linear,
    EaseInQuad,
    EaseOutQuad,
    EaseInOutQuad,
    EaseInCubic,
    EaseOutCubic,
    EaseInOutCubic,
    EaseOutBounce,
    Decelerate
};

[[nodiscard]] inline const char* animation_status_name(AnimationStatus status) {
    switch (status) {
        case AnimationStatus::Idle: return "Idle";
        case AnimationStatus::Forward: return "Forward";
        case AnimationStatus::Reverse: return "Reverse";
        case AnimationStatus::Completed: return "Completed";
        default: return "Unknown";
    }
}

// =============================================================================
// Callbacks
// =============================================================================

/// @brief Called with the new value whenever an animation value changes
using ValueListener = std::function<void(float)>;

/// @brief Called whenever an animation status changes
using StatusListener = std::function<void(AnimationStatus)>;

/// @brief Called once per frame with the dilated frame delta in seconds
using TickCallback = std::function<void(float)>;

} // namespace fold_anim
