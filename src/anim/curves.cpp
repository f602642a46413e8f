/// @file curves.cpp
/// @brief Implementation of easing curves for fold_anim module

#include "fold/anim/curves.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace fold_anim {

// =============================================================================
// Easing Functions
// =============================================================================

float Easing::ease_out_bounce(float t) {
    const float n1 = 7.5625f;
    const float d1 = 2.75f;

    if (t < 1 / d1) {
        return n1 * t * t;
    } else if (t < 2 / d1) {
        t -= 1.5f / d1;
        return n1 * t * t + 0.75f;
    } else if (t < 2.5f / d1) {
        t -= 2.25f / d1;
        return n1 * t * t + 0.9375f;
    }
    t -= 2.625f / d1;
    return n1 * t * t + 0.984375f;
}

EasingFunc Easing::get(EasingType type) {
    switch (type) {
        case EasingType::Linear: return linear;
        case EasingType::EaseInQuad: return ease_in_quad;
        case EasingType::EaseOutQuad: return ease_out_quad;
        case EasingType::EaseInOutQuad: return ease_in_out_quad;
        case EasingType::EaseInCubic: return ease_in_cubic;
        case EasingType::EaseOutCubic: return ease_out_cubic;
        case EasingType::EaseInOutCubic: return ease_in_out_cubic;
        case EasingType::EaseOutBounce: return ease_out_bounce;
        case EasingType::Decelerate: return decelerate;
        default: return linear;
    }
}

namespace {

const char* easing_type_name(EasingType type) {
    switch (type) {
        case EasingType::Linear: return "linear";
        case EasingType::EaseInQuad: return "ease_in_quad";
        case EasingType::EaseOutQuad: return "ease_out_quad";
        case EasingType::EaseInOutQuad: return "ease_in_out_quad";
        case EasingType::EaseInCubic: return "ease_in_cubic";
        case EasingType::EaseOutCubic: return "ease_out_cubic";
        case EasingType::EaseInOutCubic: return "ease_in_out_cubic";
        case EasingType::EaseOutBounce: return "ease_out_bounce";
        case EasingType::Decelerate: return "decelerate";
        default: return "unknown";
    }
}

/// One coordinate of the Bezier with control values p1, p2 at parameter m
float evaluate_cubic(float p1, float p2, float m) {
    float mt = 1.0f - m;
    return 3.0f * p1 * mt * mt * m + 3.0f * p2 * mt * m * m + m * m * m;
}

float evaluate_cubic_slope(float p1, float p2, float m) {
    float mt = 1.0f - m;
    return 3.0f * p1 * mt * mt + 6.0f * (p2 - p1) * mt * m + 3.0f * (1.0f - p2) * m * m;
}

constexpr float kCubicErrorBound = 1e-4f;

} // anonymous namespace

// =============================================================================
// ICurve
// =============================================================================

float ICurve::transform(float t) const {
    if (!(t > 0.0f)) return 0.0f;  // Also maps NaN to 0
    if (t >= 1.0f) return 1.0f;
    return transform_internal(t);
}

// =============================================================================
// Cubic
// =============================================================================

Cubic::Cubic(float a, float b, float c, float d)
    : m_a(a), m_b(b), m_c(c), m_d(d) {}

float Cubic::transform_internal(float t) const {
    // Solve x(m) = t for the Bezier parameter m, then evaluate y(m).
    // Newton converges quickly for the usual control points; bisection
    // covers the flat regions where the slope vanishes.
    float m = t;
    for (int i = 0; i < 8; ++i) {
        float x = evaluate_cubic(m_a, m_c, m) - t;
        if (std::fabs(x) < kCubicErrorBound) {
            return evaluate_cubic(m_b, m_d, m);
        }
        float dx = evaluate_cubic_slope(m_a, m_c, m);
        if (std::fabs(dx) < 1e-6f) break;
        m = std::clamp(m - x / dx, 0.0f, 1.0f);
    }

    float start = 0.0f;
    float end = 1.0f;
    m = 0.5f;
    for (int i = 0; i < 64; ++i) {
        m = (start + end) * 0.5f;
        float estimate = evaluate_cubic(m_a, m_c, m);
        if (std::fabs(t - estimate) < kCubicErrorBound) break;
        if (estimate < t) {
            start = m;
        } else {
            end = m;
        }
    }
    return evaluate_cubic(m_b, m_d, m);
}

std::string Cubic::describe() const {
    std::ostringstream oss;
    oss << "Cubic(" << m_a << ", " << m_b << ", " << m_c << ", " << m_d << ")";
    return oss.str();
}

// =============================================================================
// EasingCurve
// =============================================================================

EasingCurve::EasingCurve(EasingType type)
    : m_type(type), m_func(Easing::get(type)) {}

float EasingCurve::transform_internal(float t) const {
    return m_func(t);
}

std::string EasingCurve::describe() const {
    return std::string("Easing(") + easing_type_name(m_type) + ")";
}

// =============================================================================
// Interval
// =============================================================================

Interval::Interval(float begin, float end, CurvePtr curve)
    : m_begin(std::clamp(begin, 0.0f, 1.0f))
    , m_end(std::clamp(end, 0.0f, 1.0f))
    , m_curve(std::move(curve)) {
    if (m_end < m_begin) {
        std::swap(m_begin, m_end);
    }
}

float Interval::transform_internal(float t) const {
    if (m_end <= m_begin) {
        return t < m_begin ? 0.0f : 1.0f;
    }
    float local = std::clamp((t - m_begin) / (m_end - m_begin), 0.0f, 1.0f);
    if (local == 0.0f || local == 1.0f) {
        return local;
    }
    return m_curve ? m_curve->transform(local) : local;
}

std::string Interval::describe() const {
    std::ostringstream oss;
    oss << "Interval(" << m_begin << ", " << m_end;
    if (m_curve) {
        oss << ", " << m_curve->describe();
    }
    oss << ")";
    return oss.str();
}

// =============================================================================
// FlippedCurve
// =============================================================================

FlippedCurve::FlippedCurve(CurvePtr curve)
    : m_curve(curve ? std::move(curve) : curves::linear()) {}

float FlippedCurve::transform_internal(float t) const {
    return 1.0f - m_curve->transform(1.0f - t);
}

std::string FlippedCurve::describe() const {
    return m_curve->describe() + ".flipped";
}

CurvePtr flipped(CurvePtr curve) {
    return std::make_shared<FlippedCurve>(std::move(curve));
}

// =============================================================================
// Named Curves
// =============================================================================

namespace curves {

CurvePtr linear() {
    static const CurvePtr curve = std::make_shared<EasingCurve>(EasingType::Linear);
    return curve;
}

CurvePtr ease() {
    static const CurvePtr curve = std::make_shared<Cubic>(0.25f, 0.1f, 0.25f, 1.0f);
    return curve;
}

CurvePtr ease_in() {
    static const CurvePtr curve = std::make_shared<Cubic>(0.42f, 0.0f, 1.0f, 1.0f);
    return curve;
}

CurvePtr ease_out() {
    static const CurvePtr curve = std::make_shared<Cubic>(0.0f, 0.0f, 0.58f, 1.0f);
    return curve;
}

CurvePtr ease_in_out() {
    static const CurvePtr curve = std::make_shared<Cubic>(0.42f, 0.0f, 0.58f, 1.0f);
    return curve;
}

CurvePtr fast_out_slow_in() {
    static const CurvePtr curve = std::make_shared<Cubic>(0.4f, 0.0f, 0.2f, 1.0f);
    return curve;
}

CurvePtr decelerate() {
    static const CurvePtr curve = std::make_shared<EasingCurve>(EasingType::Decelerate);
    return curve;
}

CurvePtr bounce_out() {
    static const CurvePtr curve = std::make_shared<EasingCurve>(EasingType::EaseOutBounce);
    return curve;
}

namespace {

struct NamedCurve {
    const char* name;
    CurvePtr (*factory)();
};

const NamedCurve kNamedCurves[] = {
    {"linear", &linear},
    {"ease", &ease},
    {"ease_in", &ease_in},
    {"ease_out", &ease_out},
    {"ease_in_out", &ease_in_out},
    {"fast_out_slow_in", &fast_out_slow_in},
    {"decelerate", &decelerate},
    {"bounce_out", &bounce_out},
};

} // anonymous namespace

fold_core::Result<CurvePtr> by_name(std::string_view name) {
    for (const auto& entry : kNamedCurves) {
        if (name == entry.name) {
            return fold_core::Ok(entry.factory());
        }
    }
    return fold_core::Err<CurvePtr>(fold_core::Error(
        fold_core::ErrorCode::NotFound, "Unknown curve: " + std::string(name)));
}

const std::vector<std::string>& names() {
    static const std::vector<std::string> result = [] {
        std::vector<std::string> out;
        for (const auto& entry : kNamedCurves) {
            out.emplace_back(entry.name);
        }
        return out;
    }();
    return result;
}

} // namespace curves

} // namespace fold_anim
