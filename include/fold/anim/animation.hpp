/// @file animation.hpp
/// @brief Animation values derived from a clock

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "curves.hpp"

namespace fold_anim {

// =============================================================================
// IAnimation Interface
// =============================================================================

/// @brief A value that changes over time together with its status
class IAnimation {
public:
    virtual ~IAnimation() = default;

    /// @brief Current value
    virtual float value() const = 0;

    /// @brief Current status
    virtual AnimationStatus status() const = 0;
};

// =============================================================================
// CurvedAnimation
// =============================================================================

/// @brief Applies a curve to a parent animation.
///
/// While the parent runs in reverse the reverse curve is used when one is
/// given. The parent must outlive this object.
class CurvedAnimation : public IAnimation {
public:
    /// @throws std::invalid_argument if curve is null
    CurvedAnimation(const IAnimation& parent, CurvePtr curve, CurvePtr reverse_curve = nullptr);

    float value() const override;
    AnimationStatus status() const override { return m_parent.status(); }

    const CurvePtr& curve() const { return m_curve; }
    void set_curve(CurvePtr curve);

private:
    const IAnimation& m_parent;
    CurvePtr m_curve;
    CurvePtr m_reverse_curve;
};

// =============================================================================
// TweenAnimation
// =============================================================================

/// @brief Maps a parent's [0, 1] value onto [begin, end]
class TweenAnimation : public IAnimation {
public:
    TweenAnimation(const IAnimation& parent, float begin, float end)
        : m_parent(parent), m_begin(begin), m_end(end) {}

    float value() const override {
        return m_begin + (m_end - m_begin) * m_parent.value();
    }
    AnimationStatus status() const override { return m_parent.status(); }

    float begin() const { return m_begin; }
    float end() const { return m_end; }

private:
    const IAnimation& m_parent;
    float m_begin;
    float m_end;
};

} // namespace fold_anim
