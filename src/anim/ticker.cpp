/// @file ticker.cpp
/// @brief Implementation of the frame clock for fold_anim module

#include "fold/anim/ticker.hpp"

#include <fold/core/log.hpp>

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

namespace fold_anim {

namespace {

void check_dilation(float factor) {
    if (!std::isfinite(factor) || factor <= 0.0f) {
        throw std::invalid_argument("time dilation must be finite and > 0, got " + std::to_string(factor));
    }
}

} // anonymous namespace

// =============================================================================
// FrameScheduler
// =============================================================================

FrameScheduler::FrameScheduler(float time_dilation)
    : m_time_dilation(time_dilation) {
    check_dilation(time_dilation);
}

FrameScheduler::~FrameScheduler() {
    if (!m_tickers.empty()) {
        fold_core::anim_logger()->warn("FrameScheduler destroyed with {} ticker(s) attached", m_tickers.size());
    }
    for (auto& [id, ticker] : m_tickers) {
        ticker->m_scheduler = nullptr;
        ticker->m_active = false;
    }
}

void FrameScheduler::set_time_dilation(float factor) {
    check_dilation(factor);
    m_time_dilation = factor;
    fold_core::anim_logger()->debug("time dilation set to {}", factor);
}

void FrameScheduler::advance(float dt) {
    if (!std::isfinite(dt) || dt < 0.0f) {
        throw std::invalid_argument("frame delta must be finite and >= 0");
    }

    ++m_frame_count;
    float scaled = dt / m_time_dilation;
    m_elapsed += scaled;

    // Callbacks may attach or detach tickers; iterate over a snapshot of ids
    // and skip entries that disappeared in the meantime.
    std::vector<std::uint64_t> ids;
    ids.reserve(m_tickers.size());
    for (const auto& [id, ticker] : m_tickers) {
        if (ticker->is_active()) {
            ids.push_back(id);
        }
    }

    for (auto id : ids) {
        auto it = m_tickers.find(id);
        if (it == m_tickers.end() || !it->second->is_active()) {
            continue;
        }
        it->second->tick(scaled);
    }
}

std::size_t FrameScheduler::active_count() const {
    std::size_t count = 0;
    for (const auto& [id, ticker] : m_tickers) {
        if (ticker->is_active()) {
            ++count;
        }
    }
    return count;
}

TickerId FrameScheduler::attach(Ticker* ticker) {
    TickerId id{m_next_id++};
    m_tickers[id.value] = ticker;
    return id;
}

void FrameScheduler::detach(TickerId id) {
    m_tickers.erase(id.value);
}

// =============================================================================
// Ticker
// =============================================================================

Ticker::Ticker(FrameScheduler& scheduler, TickCallback on_tick)
    : m_scheduler(&scheduler)
    , m_on_tick(std::move(on_tick)) {
    m_id = m_scheduler->attach(this);
}

Ticker::~Ticker() {
    if (m_scheduler) {
        m_scheduler->detach(m_id);
    }
}

void Ticker::tick(float dt) {
    if (m_on_tick) {
        m_on_tick(dt);
    }
}

} // namespace fold_anim
