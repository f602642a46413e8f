/// @file types.hpp
/// @brief Value types and constants for fold_panels module

#pragma once

#include "fwd.hpp"

#include <cstdint>
#include <optional>

namespace fold_panels {

// =============================================================================
// Layout Constants
// =============================================================================

inline constexpr float kCollapsedHeaderHeight = 48.0f;
inline constexpr float kExpandedHeaderHeight = 64.0f;

/// Vertical margin added above and below an expanded header
inline constexpr float kExpandedHeaderMargin = (kExpandedHeaderHeight - kCollapsedHeaderHeight) / 2.0f;

inline constexpr float kToggleRightMargin = 8.0f;
inline constexpr float kExpandIconPadding = 16.0f;
inline constexpr float kExpandIconSize = 24.0f;
inline constexpr float kPanelGapSize = 16.0f;

// Cross fade opacity windows on the [0, 1] clock
inline constexpr float kFirstFadeEnd = 0.6f;
inline constexpr float kSecondFadeBegin = 0.4f;

// =============================================================================
// Enums
// =============================================================================

/// @brief Anchor point for alignment inside a container
enum class AnchorPoint : std::uint8_t {
    TopLeft,
    TopCenter,
    TopRight,
    MiddleLeft,
    MiddleCenter,
    MiddleRight,
    BottomLeft,
    BottomCenter,
    BottomRight
};

/// @brief Which child a cross fade animates towards
enum class CrossFadeState : std::uint8_t {
    ShowFirst,
    ShowSecond
};

[[nodiscard]] const char* anchor_point_name(AnchorPoint anchor);
[[nodiscard]] const char* cross_fade_state_name(CrossFadeState state);

// =============================================================================
// Geometry
// =============================================================================

/// @brief Width and height in logical pixels
struct Size {
    float width{0};
    float height{0};

    Size() = default;
    Size(float width, float height) : width(width), height(height) {}

    static Size zero() { return {0, 0}; }

    static Size lerp(const Size& a, const Size& b, float t) {
        return {a.width + (b.width - a.width) * t, a.height + (b.height - a.height) * t};
    }

    bool operator==(const Size&) const = default;
};

/// @brief Edge insets (margin / padding)
struct Insets {
    float left{0}, top{0}, right{0}, bottom{0};

    Insets() = default;
    Insets(float all) : left(all), top(all), right(all), bottom(all) {}
    Insets(float left, float top, float right, float bottom)
        : left(left), top(top), right(right), bottom(bottom) {}

    static Insets zero() { return {}; }

    static Insets symmetric(float horizontal, float vertical) {
        return {horizontal, vertical, horizontal, vertical};
    }

    static Insets only_right(float value) { return {0, 0, value, 0}; }

    float horizontal() const { return left + right; }
    float vertical() const { return top + bottom; }

    static Insets lerp(const Insets& a, const Insets& b, float t) {
        return {
            a.left + (b.left - a.left) * t,
            a.top + (b.top - a.top) * t,
            a.right + (b.right - a.right) * t,
            a.bottom + (b.bottom - a.bottom) * t
        };
    }

    bool operator==(const Insets&) const = default;
};

/// @brief Offsets of a stack child laid out on top of the others.
///
/// A stack child with offsets does not contribute to the stack's size.
struct PositionedOffsets {
    std::optional<float> left;
    std::optional<float> top;
    std::optional<float> right;
    std::optional<float> bottom;

    /// Pinned to the top edge, stretched horizontally
    static PositionedOffsets fill_top() { return {0.0f, 0.0f, 0.0f, std::nullopt}; }

    bool operator==(const PositionedOffsets&) const = default;
};

} // namespace fold_panels
