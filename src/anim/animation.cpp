/// @file animation.cpp
/// @brief Implementation of derived animations

#include "fold/anim/animation.hpp"

#include <stdexcept>

namespace fold_anim {

// =============================================================================
// CurvedAnimation
// =============================================================================

CurvedAnimation::CurvedAnimation(const IAnimation& parent, CurvePtr curve, CurvePtr reverse_curve)
    : m_parent(parent)
    , m_curve(std::move(curve))
    , m_reverse_curve(std::move(reverse_curve)) {
    if (!m_curve) {
        throw std::invalid_argument("CurvedAnimation requires a curve");
    }
}

void CurvedAnimation::set_curve(CurvePtr curve) {
    if (!curve) {
        throw std::invalid_argument("CurvedAnimation requires a curve");
    }
    m_curve = std::move(curve);
}

float CurvedAnimation::value() const {
    const auto& active = (m_reverse_curve && m_parent.status() == AnimationStatus::Reverse)
        ? m_reverse_curve
        : m_curve;
    return active->transform(m_parent.value());
}

} // namespace fold_anim
