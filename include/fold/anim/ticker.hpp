/// @file ticker.hpp
/// @brief Frame clock and tickers for fold_anim module

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <map>

namespace fold_anim {

// =============================================================================
// FrameScheduler
// =============================================================================

/// @brief The host's frame clock.
///
/// Each advance() is one frame: every started ticker receives the frame
/// delta divided by the time dilation factor. Tickers may be started,
/// stopped or destroyed from inside a tick callback.
class FrameScheduler {
public:
    /// @throws std::invalid_argument if time_dilation is not finite and > 0
    explicit FrameScheduler(float time_dilation = 1.0f);
    ~FrameScheduler();

    // Non-copyable, non-movable: tickers hold a pointer to their scheduler
    FrameScheduler(const FrameScheduler&) = delete;
    FrameScheduler& operator=(const FrameScheduler&) = delete;
    FrameScheduler(FrameScheduler&&) = delete;
    FrameScheduler& operator=(FrameScheduler&&) = delete;

    /// @throws std::invalid_argument if factor is not finite and > 0
    void set_time_dilation(float factor);
    float time_dilation() const { return m_time_dilation; }

    /// @brief Run one frame of dt seconds (wall clock)
    void advance(float dt);

    /// @brief Tickers currently alive on this scheduler
    std::size_t attached_count() const { return m_tickers.size(); }

    /// @brief Tickers that will receive the next frame
    std::size_t active_count() const;

    std::uint64_t frame_count() const { return m_frame_count; }

    /// @brief Sum of dilated deltas delivered so far
    double elapsed() const { return m_elapsed; }

private:
    friend class Ticker;

    TickerId attach(Ticker* ticker);
    void detach(TickerId id);

    std::map<std::uint64_t, Ticker*> m_tickers;
    std::uint64_t m_next_id{1};
    std::uint64_t m_frame_count{0};
    double m_elapsed{0};
    float m_time_dilation{1.0f};
};

// =============================================================================
// Ticker
// =============================================================================

/// @brief Per-frame callback registration.
///
/// Attached to its scheduler for its whole lifetime and ticking only while
/// started. Destroying the ticker detaches it synchronously.
class Ticker {
public:
    Ticker(FrameScheduler& scheduler, TickCallback on_tick);
    ~Ticker();

    Ticker(const Ticker&) = delete;
    Ticker& operator=(const Ticker&) = delete;
    Ticker(Ticker&&) = delete;
    Ticker& operator=(Ticker&&) = delete;

    void start() { m_active = true; }
    void stop() { m_active = false; }
    bool is_active() const { return m_active; }

    /// @brief False once the scheduler has been destroyed
    bool is_attached() const { return m_scheduler != nullptr; }

    TickerId id() const { return m_id; }

private:
    friend class FrameScheduler;

    void tick(float dt);

    FrameScheduler* m_scheduler;
    TickCallback m_on_tick;
    TickerId m_id;
    bool m_active{false};
};

} // namespace fold_anim
