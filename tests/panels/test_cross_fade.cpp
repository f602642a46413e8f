/// @file test_cross_fade.cpp
/// @brief Tests for CrossFadeTransition

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <fold/panels/cross_fade.hpp>
#include <fold/panels/layout.hpp>

#include <stdexcept>

using namespace fold_panels;
using fold_anim::AnimationStatus;
using fold_anim::FrameScheduler;
using Catch::Approx;

namespace {

CrossFadeSpec make_spec(CrossFadeState state, float duration = 1.0f) {
    CrossFadeSpec spec;
    spec.first = nodes::sized_box(std::nullopt, 0.0f);
    spec.second = nodes::content("body", {200, 100});
    spec.state = state;
    spec.duration = duration;
    spec.curve = fold_anim::curves::fast_out_slow_in();
    return spec;
}

} // anonymous namespace

TEST_CASE("CrossFadeTransition initial state", "[panels][cross_fade]") {
    FrameScheduler scheduler;

    SECTION("ShowFirst starts at 0") {
        CrossFadeTransition fade(scheduler, make_spec(CrossFadeState::ShowFirst));
        REQUIRE(fade.progress() == 0.0f);
        REQUIRE(fade.status() == AnimationStatus::Idle);
        REQUIRE(fade.first_opacity() == 1.0f);
        REQUIRE(fade.second_opacity() == 0.0f);
        REQUIRE(fade.layering() == CrossFadeLayering::FirstBase);
        REQUIRE_FALSE(fade.is_animating());
    }

    SECTION("ShowSecond starts at 1 without animating") {
        CrossFadeTransition fade(scheduler, make_spec(CrossFadeState::ShowSecond));
        REQUIRE(fade.progress() == 1.0f);
        REQUIRE(fade.status() == AnimationStatus::Completed);
        REQUIRE(fade.first_opacity() == 0.0f);
        REQUIRE(fade.second_opacity() == 1.0f);
        REQUIRE(fade.layering() == CrossFadeLayering::SecondBase);
        REQUIRE_FALSE(fade.is_animating());
    }

    SECTION("Invalid duration") {
        REQUIRE_THROWS_AS(CrossFadeTransition(scheduler, make_spec(CrossFadeState::ShowFirst, -1.0f)),
                          std::invalid_argument);
    }
}

TEST_CASE("CrossFadeTransition opacities", "[panels][cross_fade]") {
    FrameScheduler scheduler;
    CrossFadeTransition fade(scheduler, make_spec(CrossFadeState::ShowFirst));

    fade.update(make_spec(CrossFadeState::ShowSecond));
    REQUIRE(fade.status() == AnimationStatus::Forward);

    scheduler.advance(0.5f);
    REQUIRE(fade.progress() == Approx(0.5f));
    REQUIRE(fade.first_opacity() > 0.0f);
    REQUIRE(fade.first_opacity() < 1.0f);
    REQUIRE(fade.second_opacity() > 0.0f);
    REQUIRE(fade.second_opacity() < 1.0f);

    SECTION("First is gone after 60% of the clock") {
        scheduler.advance(0.1f);
        REQUIRE(fade.first_opacity() == Approx(0.0f).margin(1e-5));
    }

    SECTION("Completed") {
        scheduler.advance(0.5f);
        REQUIRE(fade.progress() == 1.0f);
        REQUIRE(fade.status() == AnimationStatus::Completed);
        REQUIRE(fade.first_opacity() == 0.0f);
        REQUIRE(fade.second_opacity() == 1.0f);
    }
}

TEST_CASE("CrossFadeTransition second waits for 40% of the clock", "[panels][cross_fade]") {
    FrameScheduler scheduler;
    CrossFadeTransition fade(scheduler, make_spec(CrossFadeState::ShowFirst));

    fade.update(make_spec(CrossFadeState::ShowSecond));
    scheduler.advance(0.375f);
    REQUIRE(fade.second_opacity() == 0.0f);
    REQUIRE(fade.first_opacity() < 1.0f);
}

TEST_CASE("CrossFadeTransition updates", "[panels][cross_fade]") {
    FrameScheduler scheduler;
    CrossFadeTransition fade(scheduler, make_spec(CrossFadeState::ShowFirst));

    SECTION("Unchanged state is a no-op") {
        fade.update(make_spec(CrossFadeState::ShowFirst));
        REQUIRE_FALSE(fade.is_animating());
        REQUIRE(fade.progress() == 0.0f);
        REQUIRE(scheduler.active_count() == 0);
    }

    SECTION("Flip mid-flight reverses from the current progress") {
        fade.update(make_spec(CrossFadeState::ShowSecond));
        scheduler.advance(0.5f);
        scheduler.advance(0.2f);
        REQUIRE(fade.progress() == Approx(0.7f));

        fade.update(make_spec(CrossFadeState::ShowFirst));
        REQUIRE(fade.target_state() == CrossFadeState::ShowFirst);
        REQUIRE(fade.status() == AnimationStatus::Reverse);
        REQUIRE(fade.layering() == CrossFadeLayering::FirstBase);

        scheduler.advance(0.1f);
        REQUIRE(fade.progress() == Approx(0.6f));

        scheduler.advance(1.0f);
        REQUIRE(fade.progress() == 0.0f);
        REQUIRE(fade.status() == AnimationStatus::Idle);
    }

    SECTION("Changing the duration does not restart the clock") {
        fade.update(make_spec(CrossFadeState::ShowSecond));
        scheduler.advance(0.5f);

        fade.update(make_spec(CrossFadeState::ShowSecond, 3.0f));
        REQUIRE(fade.duration() == 3.0f);
        REQUIRE(fade.progress() == Approx(0.5f));
        REQUIRE(fade.is_animating());

        scheduler.advance(0.5f);
        REQUIRE(fade.progress() == 1.0f);
    }

    SECTION("Changing the curve keeps the clock") {
        fade.update(make_spec(CrossFadeState::ShowSecond));
        scheduler.advance(0.25f);

        auto spec = make_spec(CrossFadeState::ShowSecond);
        spec.curve = fold_anim::curves::linear();
        fade.update(spec);
        REQUIRE(fade.progress() == Approx(0.25f));
        // Linear first fade: 1 - 0.25 / 0.6
        REQUIRE(fade.first_opacity() == Approx(1.0f - 0.25f / 0.6f));
    }
}

TEST_CASE("CrossFadeTransition build", "[panels][cross_fade]") {
    FrameScheduler scheduler;
    CrossFadeTransition fade(scheduler, make_spec(CrossFadeState::ShowFirst));

    SECTION("Clip, size and stack") {
        Node out = fade.build();
        REQUIRE(out.kind == NodeKind::ClipRect);
        const Node& size = out.children.at(0);
        REQUIRE(size.kind == NodeKind::AnimatedSize);
        REQUIRE(size.alignment == AnchorPoint::TopCenter);
        REQUIRE(size.duration == 1.0f);
        const Node& stack = size.children.at(0);
        REQUIRE(stack.kind == NodeKind::Stack);
        REQUIRE(stack.children.size() == 2);
    }

    SECTION("Collapsed: first is the base layer") {
        Node out = fade.build();
        const Node& stack = out.children[0].children[0];
        REQUIRE(*stack.children[0].key == 0);
        REQUIRE_FALSE(stack.children[0].is_positioned());
        REQUIRE(*stack.children[1].key == 1);
        REQUIRE(stack.children[1].is_positioned());
        REQUIRE(*stack.children[1].position == PositionedOffsets::fill_top());
        REQUIRE(stack.children[1].opacity == 0.0f);
        REQUIRE(measure(stack) == Size(0, 0));
    }

    SECTION("Expanding: second becomes the base layer") {
        fade.update(make_spec(CrossFadeState::ShowSecond));
        Node out = fade.build();
        const Node& stack = out.children[0].children[0];
        REQUIRE(*stack.children[0].key == 1);
        REQUIRE_FALSE(stack.children[0].is_positioned());
        REQUIRE(*stack.children[1].key == 0);
        REQUIRE(stack.children[1].is_positioned());
        REQUIRE(measure(stack) == Size(200, 100));
    }
}

TEST_CASE("CrossFadeTransition releases its ticker", "[panels][cross_fade]") {
    FrameScheduler scheduler;
    {
        CrossFadeTransition fade(scheduler, make_spec(CrossFadeState::ShowFirst));
        fade.update(make_spec(CrossFadeState::ShowSecond));
        REQUIRE(scheduler.active_count() == 1);
    }
    REQUIRE(scheduler.attached_count() == 0);
}
