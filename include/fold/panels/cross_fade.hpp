/// @file cross_fade.hpp
/// @brief Cross fade between two children with a converging size

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "node.hpp"
#include "host.hpp"

#include <fold/anim/animation.hpp>
#include <fold/anim/controller.hpp>

#include <cstdint>
#include <memory>

namespace fold_panels {

/// @brief Which child is the base layer of the stack
enum class CrossFadeLayering : std::uint8_t {
    FirstBase,   ///< First child sizes the stack, second is overlaid
    SecondBase   ///< Second child sizes the stack, first is overlaid
};

/// @brief Stateful component behind NodeKind::CrossFade.
///
/// Owns a clock in [0, 1]: ShowSecond drives it to 1 and ShowFirst back to
/// 0, starting from wherever it currently is. The first child fades out
/// over the first 60% of the clock and the second fades in over the last
/// 60%. The result is clipped and its size animates towards the base layer.
class CrossFadeTransition : public IStatefulComponent {
public:
    /// @throws std::invalid_argument if spec.duration is negative or not finite
    CrossFadeTransition(fold_anim::FrameScheduler& scheduler, const CrossFadeSpec& spec);

    /// @brief Factory registered with ComponentHost
    /// @throws std::invalid_argument if declared carries no CrossFadeSpec
    static std::unique_ptr<IStatefulComponent> create(fold_anim::FrameScheduler& scheduler,
                                                      const Node& declared);

    // IStatefulComponent
    NodeKind kind() const override { return NodeKind::CrossFade; }
    void update(const Node& declared) override;
    Node build(const Node& declared) override;

    /// @brief Take new properties; only a change of state starts a run
    void update(const CrossFadeSpec& spec);

    /// @brief ClipRect -> AnimatedSize(TopCenter) -> Stack of both layers
    Node build() const;

    // State
    float progress() const { return m_controller.value(); }
    fold_anim::AnimationStatus status() const { return m_controller.status(); }
    CrossFadeState target_state() const { return m_spec.state; }
    bool is_animating() const { return m_controller.is_animating(); }

    float first_opacity() const { return m_first_opacity.value(); }
    float second_opacity() const { return m_second_opacity.value(); }
    CrossFadeLayering layering() const;

    float duration() const { return m_controller.duration(); }
    const fold_anim::CurvePtr& curve() const { return m_spec.curve; }

private:
    CrossFadeSpec m_spec;
    fold_anim::AnimationController m_controller;
    fold_anim::CurvedAnimation m_first_curved;
    fold_anim::TweenAnimation m_first_opacity;
    fold_anim::CurvedAnimation m_second_opacity;
};

} // namespace fold_panels
