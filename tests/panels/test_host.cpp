/// @file test_host.cpp
/// @brief Tests for ComponentHost and the implicit components

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <fold/panels/cross_fade.hpp>
#include <fold/panels/host.hpp>
#include <fold/panels/implicit.hpp>

#include <memory>
#include <stdexcept>

using namespace fold_panels;
using fold_anim::FrameScheduler;
using Catch::Approx;

namespace {

Node fading_tree(CrossFadeState state, float duration = 1.0f) {
    CrossFadeSpec spec;
    spec.first = nodes::sized_box(std::nullopt, 0.0f);
    spec.second = nodes::content("body", {200, 100});
    spec.state = state;
    spec.duration = duration;
    spec.curve = fold_anim::curves::linear();
    return nodes::column({nodes::content("header", {200, 48}), nodes::cross_fade(spec)});
}

const Node& animated_size_of(const Node& composed) {
    // Column -> ClipRect -> AnimatedSize
    return composed.children.at(1).children.at(0);
}

} // anonymous namespace

TEST_CASE("ImplicitTween", "[panels][implicit]") {
    FrameScheduler scheduler;
    ImplicitTween<Size> tween(scheduler, Size(0, 0), 1.0f, fold_anim::curves::linear());

    REQUIRE(tween.value() == Size(0, 0));
    REQUIRE_FALSE(tween.set_target(Size(0, 0)));
    REQUIRE_FALSE(tween.is_animating());

    REQUIRE(tween.set_target(Size(100, 100)));
    scheduler.advance(0.5f);
    REQUIRE(tween.value().height == Approx(50.0f));

    SECTION("Retargeting starts from the current value") {
        REQUIRE(tween.set_target(Size(0, 0)));
        REQUIRE(tween.value().height == Approx(50.0f));
        scheduler.advance(0.5f);
        REQUIRE(tween.value().height == Approx(25.0f));
    }

    SECTION("Reaches the target") {
        scheduler.advance(0.5f);
        REQUIRE(tween.value() == Size(100, 100));
        REQUIRE_FALSE(tween.is_animating());
    }
}

TEST_CASE("ComponentHost composes plain trees", "[panels][host]") {
    FrameScheduler scheduler;
    ComponentHost host(scheduler);

    Node tree = nodes::column({nodes::content("a", {10, 10}), nodes::margin(Insets(4), nodes::content("b", {5, 5}))});
    Node out = host.compose(tree);

    REQUIRE(structurally_equal(out, tree));
    REQUIRE(host.mounted_count() == 0);
    REQUIRE(host.composition_count() == 1);
}

TEST_CASE("ComponentHost lifecycle", "[panels][host]") {
    FrameScheduler scheduler;
    auto host = std::make_unique<ComponentHost>(scheduler);

    host->compose(fading_tree(CrossFadeState::ShowFirst));
    REQUIRE(host->mounted_count() == 2);
    REQUIRE(host->is_mounted("/Column@0/CrossFade@1"));
    REQUIRE(host->is_mounted("/Column@0/CrossFade@1/ClipRect@0/AnimatedSize@0"));
    REQUIRE(scheduler.attached_count() == 2);

    SECTION("Components persist across compositions") {
        auto* before = host->component("/Column@0/CrossFade@1");
        REQUIRE(before != nullptr);
        host->compose(fading_tree(CrossFadeState::ShowFirst));
        REQUIRE(host->component("/Column@0/CrossFade@1") == before);
        REQUIRE(host->mounted_count() == 2);
    }

    SECTION("Removed nodes are unmounted") {
        host->compose(nodes::column({nodes::content("header", {200, 48})}));
        REQUIRE(host->mounted_count() == 0);
        REQUIRE(scheduler.attached_count() == 0);
    }

    SECTION("Mount and unmount cycles leave no tickers") {
        for (int i = 0; i < 5; ++i) {
            host->compose(fading_tree(i % 2 == 0 ? CrossFadeState::ShowSecond : CrossFadeState::ShowFirst));
            scheduler.advance(0.1f);
            host->compose(Node{});
            REQUIRE(scheduler.attached_count() == 0);
        }
    }

    SECTION("Destroying the host releases everything") {
        host.reset();
        REQUIRE(scheduler.attached_count() == 0);
    }

    SECTION("unmount_all") {
        host->unmount_all();
        REQUIRE(host->mounted_count() == 0);
        REQUIRE(scheduler.attached_count() == 0);
    }
}

TEST_CASE("ComponentHost keys identify components", "[panels][host]") {
    FrameScheduler scheduler;
    ComponentHost host(scheduler);

    auto slice_with_fade = [](NodeKey key) {
        CrossFadeSpec spec;
        spec.first = nodes::sized_box(std::nullopt, 0.0f);
        spec.second = nodes::content("body", {10, 10});
        spec.duration = 0.2f;
        return nodes::slice(key, nodes::cross_fade(spec));
    };

    host.compose(nodes::mergeable_surface({slice_with_fade(0), slice_with_fade(2)}, true));
    auto* second = host.component("/MergeableSurface@0/Slice#2/CrossFade@0");
    REQUIRE(second != nullptr);

    // Inserting a gap before the slice does not change its identity
    host.compose(nodes::mergeable_surface({slice_with_fade(0), nodes::gap(1), slice_with_fade(2)}, true));
    REQUIRE(host.component("/MergeableSurface@0/Slice#2/CrossFade@0") == second);
    REQUIRE(host.find_components(NodeKind::CrossFade).size() == 2);
}

TEST_CASE("ComponentHost animates size", "[panels][host]") {
    FrameScheduler scheduler;
    ComponentHost host(scheduler);

    Node out = host.compose(fading_tree(CrossFadeState::ShowFirst));
    REQUIRE(*animated_size_of(out).height == 0.0f);

    host.compose(fading_tree(CrossFadeState::ShowSecond));
    scheduler.advance(0.5f);
    out = host.compose(fading_tree(CrossFadeState::ShowSecond));
    REQUIRE(*animated_size_of(out).height == Approx(50.0f));
    REQUIRE(*animated_size_of(out).width == Approx(100.0f));

    scheduler.advance(0.5f);
    out = host.compose(fading_tree(CrossFadeState::ShowSecond));
    REQUIRE(*animated_size_of(out).height == Approx(100.0f));

    auto* fade = dynamic_cast<CrossFadeTransition*>(host.component("/Column@0/CrossFade@1"));
    REQUIRE(fade != nullptr);
    REQUIRE(fade->progress() == 1.0f);
    REQUIRE(fade->second_opacity() == 1.0f);
}

TEST_CASE("ComponentHost mounts expanded content at full size", "[panels][host]") {
    FrameScheduler scheduler;
    ComponentHost host(scheduler);

    Node out = host.compose(fading_tree(CrossFadeState::ShowSecond));
    REQUIRE(*animated_size_of(out).height == 100.0f);
    REQUIRE(scheduler.active_count() == 0);
}

TEST_CASE("ComponentHost animates container margins", "[panels][host]") {
    FrameScheduler scheduler;
    ComponentHost host(scheduler);

    auto tree = [](Insets margin) {
        return nodes::animated_container(1.0f, fold_anim::curves::linear(), margin,
                                         nodes::content("a", {10, 10}));
    };

    Node out = host.compose(tree(Insets::zero()));
    REQUIRE(out.insets == Insets::zero());

    host.compose(tree(Insets::symmetric(0, 8)));
    scheduler.advance(0.5f);
    out = host.compose(tree(Insets::symmetric(0, 8)));
    REQUIRE(out.insets.top == Approx(4.0f));
    REQUIRE(out.insets.bottom == Approx(4.0f));

    auto* container = dynamic_cast<AnimatedContainerComponent*>(host.component("/AnimatedContainer@0"));
    REQUIRE(container != nullptr);
    REQUIRE(container->is_animating());
}

TEST_CASE("ComponentHost errors", "[panels][host]") {
    FrameScheduler scheduler;
    ComponentHost host(scheduler);

    SECTION("Cross fade without spec") {
        Node broken;
        broken.kind = NodeKind::CrossFade;
        REQUIRE_THROWS_AS(host.compose(broken), std::invalid_argument);
        REQUIRE(host.mounted_count() == 0);
    }

    SECTION("Factories only for stateful kinds") {
        REQUIRE_THROWS_AS(host.register_factory(NodeKind::Row, nullptr), std::invalid_argument);
    }
}
