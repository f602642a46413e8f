/// @file controller.cpp
/// @brief Implementation of AnimationController

#include "fold/anim/controller.hpp"

#include <fold/core/log.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace fold_anim {

namespace {

void check_duration(float seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0f) {
        throw std::invalid_argument("animation duration must be finite and >= 0, got " + std::to_string(seconds));
    }
}

float clamp_unit(float v) {
    if (std::isnan(v)) return 0.0f;
    return std::clamp(v, 0.0f, 1.0f);
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

AnimationController::AnimationController(FrameScheduler& scheduler, float duration, float initial_value)
    : m_ticker(scheduler, [this](float dt) { on_tick(dt); })
    , m_duration(duration)
    , m_value(clamp_unit(initial_value)) {
    check_duration(duration);
    settle_status();
}

AnimationController::~AnimationController() {
    if (m_ticker.is_active()) {
        fold_core::anim_logger()->trace("controller released mid-run at {:.3f}", m_value);
    }
}

void AnimationController::set_duration(float seconds) {
    check_duration(seconds);
    m_duration = seconds;
}

// =============================================================================
// Control
// =============================================================================

void AnimationController::forward() {
    start_run(1.0f, AnimationDirection::Forward);
}

void AnimationController::reverse() {
    start_run(0.0f, AnimationDirection::Reverse);
}

void AnimationController::animate_to(float target) {
    target = clamp_unit(target);
    start_run(target, target >= m_value ? AnimationDirection::Forward : AnimationDirection::Reverse);
}

void AnimationController::stop() {
    m_ticker.stop();
}

void AnimationController::set_value(float value) {
    m_ticker.stop();
    value = clamp_unit(value);
    if (value != m_value) {
        m_value = value;
        notify_value();
    }
    settle_status();
}

void AnimationController::start_run(float target, AnimationDirection direction) {
    m_direction = direction;
    m_run_from = m_value;
    m_run_to = target;
    m_run_elapsed = 0.0f;
    m_run_length = m_duration * std::fabs(target - m_value);

    if (m_run_length <= 0.0f) {
        // Nothing to animate: jump and report the final status
        m_ticker.stop();
        if (m_value != target) {
            m_value = target;
            notify_value();
        }
        settle_status();
        return;
    }

    set_status(direction == AnimationDirection::Forward ? AnimationStatus::Forward : AnimationStatus::Reverse);
    m_ticker.start();
    fold_core::anim_logger()->trace("run {:.3f} -> {:.3f} over {:.3f}s", m_run_from, m_run_to, m_run_length);
}

void AnimationController::on_tick(float dt) {
    m_run_elapsed += dt;
    float t = m_run_elapsed / m_run_length;

    if (t >= 1.0f) {
        m_value = m_run_to;
        m_ticker.stop();
        notify_value();
        settle_status();
        fold_core::anim_logger()->trace("run finished at {:.3f}", m_value);
        return;
    }

    m_value = m_run_from + (m_run_to - m_run_from) * t;
    notify_value();
}

// =============================================================================
// Status
// =============================================================================

void AnimationController::settle_status() {
    if (m_value <= 0.0f) {
        set_status(AnimationStatus::Idle);
    } else if (m_value >= 1.0f) {
        set_status(AnimationStatus::Completed);
    } else {
        set_status(m_direction == AnimationDirection::Forward ? AnimationStatus::Forward : AnimationStatus::Reverse);
    }
}

void AnimationController::set_status(AnimationStatus status) {
    if (status == m_status) return;
    m_status = status;

    auto listeners = m_status_listeners;
    for (const auto& [id, listener] : listeners) {
        listener(status);
    }
}

// =============================================================================
// Listeners
// =============================================================================

ListenerId AnimationController::add_listener(ValueListener listener) {
    ListenerId id{m_next_listener++};
    m_value_listeners.emplace_back(id, std::move(listener));
    return id;
}

ListenerId AnimationController::add_status_listener(StatusListener listener) {
    ListenerId id{m_next_listener++};
    m_status_listeners.emplace_back(id, std::move(listener));
    return id;
}

bool AnimationController::remove_listener(ListenerId id) {
    auto matches = [id](const auto& entry) { return entry.first == id; };

    auto vit = std::find_if(m_value_listeners.begin(), m_value_listeners.end(), matches);
    if (vit != m_value_listeners.end()) {
        m_value_listeners.erase(vit);
        return true;
    }

    auto sit = std::find_if(m_status_listeners.begin(), m_status_listeners.end(), matches);
    if (sit != m_status_listeners.end()) {
        m_status_listeners.erase(sit);
        return true;
    }
    return false;
}

void AnimationController::notify_value() {
    auto listeners = m_value_listeners;
    for (const auto& [id, listener] : listeners) {
        listener(m_value);
    }
}

} // namespace fold_anim
