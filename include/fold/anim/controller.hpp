/// @file controller.hpp
/// @brief Animation controller for fold_anim module

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "animation.hpp"
#include "ticker.hpp"

#include <cstdint>
#include <utility>
#include <vector>

namespace fold_anim {

// =============================================================================
// AnimationController
// =============================================================================

/// @brief A clock in [0, 1] driven by a FrameScheduler.
///
/// A run towards a target lasts duration * |target - value|, so a run that
/// starts mid-flight (for example a reversal at 0.7) keeps the same speed
/// and continues from the current value. The ticker is started only while
/// a run is in progress and released when the controller is destroyed.
class AnimationController : public IAnimation {
public:
    /// @param duration Seconds for a full 0 -> 1 run
    /// @throws std::invalid_argument if duration is negative or not finite
    AnimationController(FrameScheduler& scheduler, float duration, float initial_value = 0.0f);
    ~AnimationController() override;

    AnimationController(const AnimationController&) = delete;
    AnimationController& operator=(const AnimationController&) = delete;

    // IAnimation
    float value() const override { return m_value; }
    AnimationStatus status() const override { return m_status; }

    // Configuration
    float duration() const { return m_duration; }

    /// @brief Change the duration of subsequent runs; a run in progress keeps its timing
    /// @throws std::invalid_argument if seconds is negative or not finite
    void set_duration(float seconds);

    AnimationDirection direction() const { return m_direction; }
    bool is_animating() const { return m_ticker.is_active(); }

    // Control
    void forward();
    void reverse();
    void animate_to(float target);
    void stop();

    /// @brief Jump to a value, stopping any run
    void set_value(float value);

    // Listeners
    ListenerId add_listener(ValueListener listener);
    ListenerId add_status_listener(StatusListener listener);
    bool remove_listener(ListenerId id);

private:
    void start_run(float target, AnimationDirection direction);
    void on_tick(float dt);
    void settle_status();
    void set_status(AnimationStatus status);
    void notify_value();

    Ticker m_ticker;
    float m_duration;
    float m_value;
    AnimationStatus m_status{AnimationStatus::Idle};
    AnimationDirection m_direction{AnimationDirection::Forward};

    // Current run
    float m_run_from{0};
    float m_run_to{0};
    float m_run_length{0};
    float m_run_elapsed{0};

    std::uint64_t m_next_listener{1};
    std::vector<std::pair<ListenerId, ValueListener>> m_value_listeners;
    std::vector<std::pair<ListenerId, StatusListener>> m_status_listeners;
};

} // namespace fold_anim
