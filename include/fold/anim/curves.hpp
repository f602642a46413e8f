/// @file curves.hpp
/// @brief Easing curves for fold_anim module

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <fold/core/error.hpp>

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace fold_anim {

// =============================================================================
// Easing Functions
// =============================================================================

/// @brief Easing function type
using EasingFunc = std::function<float(float)>;

/// @brief Collection of polynomial easing functions on [0, 1]
class Easing {
public:
    static float linear(float t) { return t; }

    static float ease_in_quad(float t) { return t * t; }
    static float ease_out_quad(float t) { return t * (2 - t); }
    static float ease_in_out_quad(float t) {
        return t < 0.5f ? 2 * t * t : -1 + (4 - 2 * t) * t;
    }

    static float ease_in_cubic(float t) { return t * t * t; }
    static float ease_out_cubic(float t) {
        float f = t - 1;
        return f * f * f + 1;
    }
    static float ease_in_out_cubic(float t) {
        return t < 0.5f ? 4 * t * t * t : (t - 1) * (2 * t - 2) * (2 * t - 2) + 1;
    }

    static float ease_out_bounce(float t);

    /// Rapid start, gradual stop: 1 - (1 - t)^2
    static float decelerate(float t) {
        float f = 1 - t;
        return 1 - f * f;
    }

    /// @brief Get easing function by type
    static EasingFunc get(EasingType type);
};

// =============================================================================
// ICurve Interface
// =============================================================================

/// @brief Maps a unit interval onto itself.
///
/// transform() clamps its input and returns 0 and 1 exactly at the ends,
/// so implementations only see the open interval.
class ICurve {
public:
    virtual ~ICurve() = default;

    [[nodiscard]] float transform(float t) const;

    /// @brief Human readable description, e.g. "Cubic(0.4, 0, 0.2, 1)"
    [[nodiscard]] virtual std::string describe() const = 0;

protected:
    virtual float transform_internal(float t) const = 0;
};

using CurvePtr = std::shared_ptr<const ICurve>;

// =============================================================================
// Curve Implementations
// =============================================================================

/// @brief Cubic Bezier through (0,0), (a,b), (c,d), (1,1)
class Cubic final : public ICurve {
public:
    Cubic(float a, float b, float c, float d);

    [[nodiscard]] std::string describe() const override;

    float a() const { return m_a; }
    float b() const { return m_b; }
    float c() const { return m_c; }
    float d() const { return m_d; }

protected:
    float transform_internal(float t) const override;

private:
    float m_a;
    float m_b;
    float m_c;
    float m_d;
};

/// @brief Curve backed by one of the Easing functions
class EasingCurve final : public ICurve {
public:
    explicit EasingCurve(EasingType type);

    [[nodiscard]] std::string describe() const override;
    EasingType type() const { return m_type; }

protected:
    float transform_internal(float t) const override;

private:
    EasingType m_type;
    EasingFunc m_func;
};

/// @brief 0 until begin, 1 after end, the inner curve stretched in between
class Interval final : public ICurve {
public:
    /// @param curve Inner curve, linear when null
    Interval(float begin, float end, CurvePtr curve = nullptr);

    [[nodiscard]] std::string describe() const override;

    float begin() const { return m_begin; }
    float end() const { return m_end; }

protected:
    float transform_internal(float t) const override;

private:
    float m_begin;
    float m_end;
    CurvePtr m_curve;
};

/// @brief Curve mirrored on both axes: 1 - c(1 - t)
class FlippedCurve final : public ICurve {
public:
    explicit FlippedCurve(CurvePtr curve);

    [[nodiscard]] std::string describe() const override;
    const CurvePtr& inner() const { return m_curve; }

protected:
    float transform_internal(float t) const override;

private:
    CurvePtr m_curve;
};

/// @brief Shorthand for std::make_shared<FlippedCurve>(curve)
[[nodiscard]] CurvePtr flipped(CurvePtr curve);

// =============================================================================
// Named Curves
// =============================================================================

namespace curves {

[[nodiscard]] CurvePtr linear();
[[nodiscard]] CurvePtr ease();
[[nodiscard]] CurvePtr ease_in();
[[nodiscard]] CurvePtr ease_out();
[[nodiscard]] CurvePtr ease_in_out();
[[nodiscard]] CurvePtr fast_out_slow_in();
[[nodiscard]] CurvePtr decelerate();
[[nodiscard]] CurvePtr bounce_out();

/// @brief Resolve a curve from its configuration name ("fast_out_slow_in", ...)
[[nodiscard]] fold_core::Result<CurvePtr> by_name(std::string_view name);

/// @brief Names accepted by by_name
[[nodiscard]] const std::vector<std::string>& names();

} // namespace curves

} // namespace fold_anim
