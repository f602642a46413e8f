/// @file test_ticker.cpp
/// @brief Tests for FrameScheduler and Ticker

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <fold/anim/ticker.hpp>

#include <cmath>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace fold_anim;
using Catch::Approx;

TEST_CASE("FrameScheduler construction", "[anim][ticker]") {
    SECTION("Default dilation") {
        FrameScheduler scheduler;
        REQUIRE(scheduler.time_dilation() == 1.0f);
        REQUIRE(scheduler.attached_count() == 0);
        REQUIRE(scheduler.frame_count() == 0);
    }

    SECTION("Invalid dilation") {
        REQUIRE_THROWS_AS(FrameScheduler(0.0f), std::invalid_argument);
        REQUIRE_THROWS_AS(FrameScheduler(-2.0f), std::invalid_argument);
        REQUIRE_THROWS_AS(FrameScheduler(std::nanf("")), std::invalid_argument);

        FrameScheduler scheduler;
        REQUIRE_THROWS_AS(scheduler.set_time_dilation(0.0f), std::invalid_argument);
        REQUIRE(scheduler.time_dilation() == 1.0f);
    }

    SECTION("Negative delta") {
        FrameScheduler scheduler;
        REQUIRE_THROWS_AS(scheduler.advance(-0.1f), std::invalid_argument);
    }
}

TEST_CASE("Ticker lifetime", "[anim][ticker]") {
    FrameScheduler scheduler;

    {
        Ticker ticker(scheduler, [](float) {});
        REQUIRE(scheduler.attached_count() == 1);
        REQUIRE(scheduler.active_count() == 0);
        REQUIRE(ticker.is_attached());
        REQUIRE(ticker.id());
    }

    REQUIRE(scheduler.attached_count() == 0);
}

TEST_CASE("Ticker delivery", "[anim][ticker]") {
    FrameScheduler scheduler;
    std::vector<float> deltas;
    Ticker ticker(scheduler, [&](float dt) { deltas.push_back(dt); });

    SECTION("Stopped ticker receives nothing") {
        scheduler.advance(0.25f);
        REQUIRE(deltas.empty());
        REQUIRE(scheduler.frame_count() == 1);
    }

    SECTION("Started ticker receives each frame") {
        ticker.start();
        scheduler.advance(0.25f);
        scheduler.advance(0.5f);
        REQUIRE(deltas.size() == 2);
        REQUIRE(deltas[0] == Approx(0.25f));
        REQUIRE(deltas[1] == Approx(0.5f));

        ticker.stop();
        scheduler.advance(0.25f);
        REQUIRE(deltas.size() == 2);
    }

    SECTION("Time dilation divides deltas") {
        scheduler.set_time_dilation(2.0f);
        ticker.start();
        scheduler.advance(0.5f);
        REQUIRE(deltas.size() == 1);
        REQUIRE(deltas[0] == Approx(0.25f));
        REQUIRE(scheduler.elapsed() == Approx(0.25));
    }
}

TEST_CASE("Ticker destroyed during a frame", "[anim][ticker]") {
    FrameScheduler scheduler;
    int second_ticks = 0;

    std::unique_ptr<Ticker> second;
    Ticker first(scheduler, [&](float) { second.reset(); });
    second = std::make_unique<Ticker>(scheduler, [&](float) { ++second_ticks; });

    first.start();
    second->start();
    scheduler.advance(0.1f);

    REQUIRE(second == nullptr);
    REQUIRE(second_ticks == 0);
    REQUIRE(scheduler.attached_count() == 1);
}

TEST_CASE("Ticker outliving its scheduler", "[anim][ticker]") {
    auto scheduler = std::make_unique<FrameScheduler>();
    Ticker ticker(*scheduler, [](float) {});
    ticker.start();

    scheduler.reset();
    REQUIRE_FALSE(ticker.is_attached());
    REQUIRE_FALSE(ticker.is_active());
}
