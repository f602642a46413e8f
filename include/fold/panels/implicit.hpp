/// @file implicit.hpp
/// @brief Retargetable tween for implicitly animated properties

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <fold/anim/controller.hpp>
#include <fold/anim/curves.hpp>

#include <utility>

namespace fold_panels {

/// @brief Animates a value towards the most recent target.
///
/// Setting a new target starts a fresh run from the value currently shown,
/// so a target change in the middle of a run never jumps.
/// @tparam T Value type providing static T::lerp(a, b, t) and operator==
template<typename T>
class ImplicitTween {
public:
    ImplicitTween(fold_anim::FrameScheduler& scheduler, T initial, float duration, fold_anim::CurvePtr curve)
        : m_controller(scheduler, duration, 1.0f)
        , m_begin(initial)
        , m_end(std::move(initial))
        , m_curve(curve ? std::move(curve) : fold_anim::curves::linear()) {}

    /// @brief Current interpolated value
    T value() const {
        return T::lerp(m_begin, m_end, m_curve->transform(m_controller.value()));
    }

    const T& target() const { return m_end; }

    /// @return true when a new run was started
    bool set_target(const T& target) {
        if (target == m_end) return false;
        m_begin = value();
        m_end = target;
        m_controller.set_value(0.0f);
        m_controller.forward();
        return true;
    }

    void set_duration(float seconds) { m_controller.set_duration(seconds); }
    float duration() const { return m_controller.duration(); }

    void set_curve(fold_anim::CurvePtr curve) {
        if (curve) m_curve = std::move(curve);
    }

    bool is_animating() const { return m_controller.is_animating(); }

    /// @brief Normalized progress of the current run
    float progress() const { return m_controller.value(); }

private:
    fold_anim::AnimationController m_controller;
    T m_begin;
    T m_end;
    fold_anim::CurvePtr m_curve;
};

} // namespace fold_panels
