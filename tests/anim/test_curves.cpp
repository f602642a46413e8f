/// @file test_curves.cpp
/// @brief Tests for easing curves

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <fold/anim/curves.hpp>
#include <fold/core/config.hpp>

#include <memory>

using namespace fold_anim;
using Catch::Approx;

TEST_CASE("Easing functions", "[anim][curves]") {
    REQUIRE(Easing::linear(0.3f) == Approx(0.3f));
    REQUIRE(Easing::ease_in_quad(0.5f) == Approx(0.25f));
    REQUIRE(Easing::ease_out_quad(0.5f) == Approx(0.75f));
    REQUIRE(Easing::ease_in_cubic(0.5f) == Approx(0.125f));
    REQUIRE(Easing::decelerate(0.5f) == Approx(0.75f));
    REQUIRE(Easing::ease_out_bounce(1.0f) == Approx(1.0f));
    REQUIRE(Easing::get(EasingType::EaseInQuad)(0.5f) == Approx(0.25f));
}

TEST_CASE("Named curves are exact at the ends", "[anim][curves]") {
    for (const auto& name : curves::names()) {
        auto curve = curves::by_name(name);
        REQUIRE(curve.is_ok());
        REQUIRE(curve.value()->transform(0.0f) == 0.0f);
        REQUIRE(curve.value()->transform(1.0f) == 1.0f);
        REQUIRE(curve.value()->transform(-0.5f) == 0.0f);
        REQUIRE(curve.value()->transform(1.5f) == 1.0f);
    }
}

TEST_CASE("Cubic", "[anim][curves]") {
    SECTION("Linear control points") {
        Cubic cubic(0.0f, 0.0f, 1.0f, 1.0f);
        REQUIRE(cubic.transform(0.25f) == Approx(0.25f).margin(0.002));
        REQUIRE(cubic.transform(0.75f) == Approx(0.75f).margin(0.002));
    }

    SECTION("Fast out slow in") {
        auto curve = curves::fast_out_slow_in();
        REQUIRE(curve->transform(0.5f) == Approx(0.7755f).margin(0.005));
        REQUIRE(curve->describe() == "Cubic(0.4, 0, 0.2, 1)");

        float previous = 0.0f;
        for (int i = 1; i <= 20; ++i) {
            float value = curve->transform(static_cast<float>(i) / 20.0f);
            REQUIRE(value >= previous);
            previous = value;
        }
    }

    SECTION("Ease in starts slowly") {
        REQUIRE(curves::ease_in()->transform(0.2f) < 0.2f);
        REQUIRE(curves::ease_out()->transform(0.2f) > 0.2f);
    }
}

TEST_CASE("Interval", "[anim][curves]") {
    SECTION("Linear inside the window") {
        Interval interval(0.4f, 1.0f);
        REQUIRE(interval.transform(0.2f) == 0.0f);
        REQUIRE(interval.transform(0.4f) == 0.0f);
        REQUIRE(interval.transform(0.7f) == Approx(0.5f));
        REQUIRE(interval.transform(1.0f) == 1.0f);
    }

    SECTION("Inner curve is stretched") {
        Interval interval(0.0f, 0.5f, std::make_shared<EasingCurve>(EasingType::EaseInQuad));
        REQUIRE(interval.transform(0.25f) == Approx(0.25f));
        REQUIRE(interval.transform(0.6f) == 1.0f);
    }

    SECTION("Degenerate window is a step") {
        Interval step(0.5f, 0.5f);
        REQUIRE(step.transform(0.49f) == 0.0f);
        REQUIRE(step.transform(0.51f) == 1.0f);
    }

    SECTION("Description") {
        Interval interval(0.0f, 0.6f, curves::fast_out_slow_in());
        REQUIRE(interval.describe() == "Interval(0, 0.6, Cubic(0.4, 0, 0.2, 1))");
    }
}

TEST_CASE("Flipped curve", "[anim][curves]") {
    auto curve = curves::fast_out_slow_in();
    auto mirror = flipped(curve);

    for (float t : {0.1f, 0.3f, 0.5f, 0.8f}) {
        REQUIRE(mirror->transform(t) == Approx(1.0f - curve->transform(1.0f - t)));
    }
    REQUIRE(mirror->transform(0.0f) == 0.0f);
    REQUIRE(mirror->transform(1.0f) == 1.0f);
    // Fast out slow in mirrored starts slowly
    REQUIRE(mirror->transform(0.2f) < 0.2f);
}

TEST_CASE("curves::by_name", "[anim][curves]") {
    SECTION("Known name") {
        auto curve = curves::by_name("decelerate");
        REQUIRE(curve.is_ok());
        REQUIRE(curve.value() == curves::decelerate());
    }

    SECTION("Unknown name") {
        auto curve = curves::by_name("wobble");
        REQUIRE(curve.is_err());
        REQUIRE(curve.error().code() == fold_core::ErrorCode::NotFound);
    }

    SECTION("All names resolve") {
        REQUIRE(curves::names().size() == 8);
    }

    SECTION("Config accepts exactly the named curves") {
        REQUIRE(fold_core::curve_names() == curves::names());
        for (const auto& name : fold_core::curve_names()) {
            REQUIRE(curves::by_name(name).is_ok());
        }
    }
}
