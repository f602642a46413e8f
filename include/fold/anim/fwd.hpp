/// @file fwd.hpp
/// @brief Forward declarations for fold_anim module

#pragma once

#include <cstdint>
#include <functional>

namespace fold_anim {

// =============================================================================
// Handle Types
// =============================================================================

/// @brief Identifier of a ticker registered with a FrameScheduler
struct TickerId {
    std::uint64_t value{0};
    bool operator==(const TickerId&) const = default;
    bool operator!=(const TickerId&) const = default;
    explicit operator bool() const { return value != 0; }
};

/// @brief Identifier returned when adding an animation listener
struct ListenerId {
    std::uint64_t value{0};
    bool operator==(const ListenerId&) const = default;
    bool operator!=(const ListenerId&) const = default;
    explicit operator bool() const { return value != 0; }
};

// =============================================================================
// Enums
// =============================================================================

enum class AnimationStatus : std::uint8_t;
enum class AnimationDirection : std::uint8_t;
enum class EasingType : std::uint8_t;

// =============================================================================
// Forward Declarations - Curves
// =============================================================================

class ICurve;
class Cubic;
class EasingCurve;
class Interval;
class FlippedCurve;
class Easing;

// =============================================================================
// Forward Declarations - Timing
// =============================================================================

class FrameScheduler;
class Ticker;

// =============================================================================
// Forward Declarations - Animations
// =============================================================================

class IAnimation;
class AnimationController;
class CurvedAnimation;
class TweenAnimation;

} // namespace fold_anim

// =============================================================================
// Hash Specializations
// =============================================================================

namespace std {

template<>
struct hash<fold_anim::TickerId> {
    std::size_t operator()(const fold_anim::TickerId& id) const noexcept {
        return std::hash<std::uint64_t>{}(id.value);
    }
};

template<>
struct hash<fold_anim::ListenerId> {
    std::size_t operator()(const fold_anim::ListenerId& id) const noexcept {
        return std::hash<std::uint64_t>{}(id.value);
    }
};

} // namespace std
