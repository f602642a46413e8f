/// @file cross_fade.cpp
/// @brief Implementation of CrossFadeTransition

#include "fold/panels/cross_fade.hpp"

#include <fold/core/log.hpp>

#include <stdexcept>

namespace fold_panels {

namespace {

fold_anim::CurvePtr curve_or_linear(const fold_anim::CurvePtr& curve) {
    return curve ? curve : fold_anim::curves::linear();
}

fold_anim::CurvePtr first_interval(const fold_anim::CurvePtr& curve) {
    return std::make_shared<fold_anim::Interval>(0.0f, kFirstFadeEnd, curve);
}

fold_anim::CurvePtr second_interval(const fold_anim::CurvePtr& curve) {
    return std::make_shared<fold_anim::Interval>(kSecondFadeBegin, 1.0f, fold_anim::flipped(curve));
}

CrossFadeSpec normalized(CrossFadeSpec spec) {
    spec.curve = curve_or_linear(spec.curve);
    return spec;
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

CrossFadeTransition::CrossFadeTransition(fold_anim::FrameScheduler& scheduler, const CrossFadeSpec& spec)
    : m_spec(normalized(spec))
    , m_controller(scheduler, spec.duration,
                   spec.state == CrossFadeState::ShowSecond ? 1.0f : 0.0f)
    , m_first_curved(m_controller, first_interval(m_spec.curve))
    , m_first_opacity(m_first_curved, 1.0f, 0.0f)
    , m_second_opacity(m_controller, second_interval(m_spec.curve)) {}

std::unique_ptr<IStatefulComponent> CrossFadeTransition::create(fold_anim::FrameScheduler& scheduler,
                                                                 const Node& declared) {
    if (!declared.cross_fade) {
        throw std::invalid_argument("CrossFade node without a CrossFadeSpec");
    }
    return std::make_unique<CrossFadeTransition>(scheduler, *declared.cross_fade);
}

// =============================================================================
// Update
// =============================================================================

void CrossFadeTransition::update(const Node& declared) {
    if (!declared.cross_fade) {
        throw std::invalid_argument("CrossFade node without a CrossFadeSpec");
    }
    update(*declared.cross_fade);
}

void CrossFadeTransition::update(const CrossFadeSpec& spec) {
    CrossFadeState previous = m_spec.state;
    fold_anim::CurvePtr previous_curve = m_spec.curve;

    m_spec = normalized(spec);

    if (m_spec.duration != m_controller.duration()) {
        m_controller.set_duration(m_spec.duration);
    }

    if (m_spec.curve != previous_curve) {
        m_first_curved.set_curve(first_interval(m_spec.curve));
        m_second_opacity.set_curve(second_interval(m_spec.curve));
    }

    if (m_spec.state == previous) {
        return;
    }

    fold_core::panels_logger()->trace("cross fade -> {} from {:.3f}",
                                      cross_fade_state_name(m_spec.state), m_controller.value());
    switch (m_spec.state) {
        case CrossFadeState::ShowFirst:
            m_controller.reverse();
            break;
        case CrossFadeState::ShowSecond:
            m_controller.forward();
            break;
    }
}

// =============================================================================
// Build
// =============================================================================

CrossFadeLayering CrossFadeTransition::layering() const {
    auto status = m_controller.status();
    if (status == fold_anim::AnimationStatus::Completed || status == fold_anim::AnimationStatus::Forward) {
        return CrossFadeLayering::SecondBase;
    }
    return CrossFadeLayering::FirstBase;
}

Node CrossFadeTransition::build(const Node&) {
    return build();
}

Node CrossFadeTransition::build() const {
    // Layers keep their keys when they swap places so their subtrees stay mounted
    Node first = nodes::keyed(0, nodes::opacity(first_opacity(), m_spec.first));
    Node second = nodes::keyed(1, nodes::opacity(second_opacity(), m_spec.second));

    std::vector<Node> layers;
    layers.reserve(2);
    if (layering() == CrossFadeLayering::SecondBase) {
        layers.push_back(std::move(second));
        layers.push_back(nodes::positioned(PositionedOffsets::fill_top(), std::move(first)));
    } else {
        layers.push_back(std::move(first));
        layers.push_back(nodes::positioned(PositionedOffsets::fill_top(), std::move(second)));
    }

    return nodes::clip_rect(
        nodes::animated_size(m_spec.duration, m_spec.curve, AnchorPoint::TopCenter,
                             nodes::stack(std::move(layers))));
}

} // namespace fold_panels
