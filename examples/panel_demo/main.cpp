/// @file main.cpp
/// @brief Expansion Panel Demo
///
/// Headless run of a three panel list: opens the second panel through its
/// expand icon, drives the frames until the transitions settle and logs the
/// composed tree. Usage: panel_demo [config.json]

#include <fold/anim/curves.hpp>
#include <fold/anim/ticker.hpp>
#include <fold/core/config.hpp>
#include <fold/core/log.hpp>
#include <fold/panels/cross_fade.hpp>
#include <fold/panels/expansion_panel.hpp>
#include <fold/panels/host.hpp>
#include <fold/panels/layout.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <utility>
#include <vector>

namespace {

constexpr float kFrameTime = 1.0f / 60.0f;
constexpr int kMaxFrames = 600;

struct DemoState {
    std::vector<bool> expanded{false, false, false};
};

fold_core::Result<fold_panels::ExpansionPanelList> build_list(DemoState& state, const fold_core::FoldConfig& config,
                                                              const fold_anim::CurvePtr& curve) {
    static const char* titles[] = {"General", "Display", "Advanced"};

    std::vector<fold_panels::ExpansionPanel> panels;
    for (std::size_t i = 0; i < state.expanded.size(); ++i) {
        std::string title = titles[i];
        auto header = [title](const fold_panels::BuildContext& ctx, bool expanded) {
            return fold_panels::nodes::content(
                title + " (" + std::to_string(ctx.panel_index + 1) + "/" + std::to_string(ctx.panel_count) + ")"
                    + (expanded ? " -" : " +"),
                {240.0f, 20.0f});
        };
        auto body = fold_panels::nodes::content(title + " settings", {240.0f, 80.0f + 40.0f * static_cast<float>(i)});

        auto panel = fold_panels::ExpansionPanel::create(std::move(header), std::move(body), state.expanded[i]);
        if (!panel) {
            return fold_core::Err<fold_panels::ExpansionPanelList>(panel.error());
        }
        panels.push_back(std::move(panel).unwrap());
    }

    auto on_toggle = [&state](std::size_t index, bool expanded) {
        FOLD_LOG_INFO("Panel {} requested {}", index, expanded ? "open" : "closed");
        state.expanded.at(index) = expanded;
    };

    return fold_panels::ExpansionPanelList::create(std::move(panels), std::move(on_toggle),
                                                   config.animation_duration, curve);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    fold_core::FoldConfig config;
    if (argc > 1) {
        auto loaded = fold_core::load_config_file(argv[1]);
        if (!loaded) {
            FOLD_LOG_ERROR("{}", fold_core::build_error_chain(loaded.error()));
            return 1;
        }
        config = std::move(loaded).unwrap();
    }

    fold_core::configure_logging(config.log);
    FOLD_LOG_INFO("=== Expansion Panel Demo ===");
    FOLD_LOG_INFO("Config: {}", fold_core::config_to_json(config).dump());

    auto curve = fold_anim::curves::by_name(config.curve);
    if (!curve) {
        FOLD_LOG_ERROR("{}", fold_core::build_error_chain(curve.error()));
        return 1;
    }

    fold_anim::FrameScheduler scheduler(config.time_dilation);
    fold_panels::ComponentHost host(scheduler);
    DemoState state;

    auto list = build_list(state, config, *curve);
    if (!list) {
        FOLD_LOG_ERROR("{}", fold_core::build_error_chain(list.error()));
        return 1;
    }

    fold_panels::Node declared = list->build(fold_panels::BuildContext{});
    fold_panels::Node composed = host.compose(declared);
    FOLD_LOG_INFO("Mounted {} component(s), {} ticker(s)", host.mounted_count(), scheduler.attached_count());
    FOLD_LOG_INFO("Initial height: {}", fold_panels::measure(composed).height);

    // Press the expand icon of the second panel
    auto icons = fold_panels::find_all(declared, fold_panels::NodeKind::ExpandIcon);
    icons.at(1)->on_pressed();

    int frame = 0;
    do {
        list = build_list(state, config, *curve);
        if (!list) {
            FOLD_LOG_ERROR("{}", fold_core::build_error_chain(list.error()));
            return 1;
        }
        composed = host.compose(list->build(fold_panels::BuildContext{}));

        for (auto* fade : host.find_components(fold_panels::NodeKind::CrossFade)) {
            auto* transition = static_cast<fold_panels::CrossFadeTransition*>(fade);
            if (transition->is_animating()) {
                FOLD_LOG_DEBUG("frame {}: progress {:.3f}, opacities {:.3f}/{:.3f}", frame,
                               transition->progress(), transition->first_opacity(), transition->second_opacity());
            }
        }

        if (scheduler.active_count() == 0) break;
        scheduler.advance(kFrameTime);
    } while (++frame < kMaxFrames);

    FOLD_LOG_INFO("Settled after {} frame(s), {:.3f}s", scheduler.frame_count(), scheduler.elapsed());
    FOLD_LOG_INFO("Final height: {}", fold_panels::measure(composed).height);
    FOLD_LOG_INFO("Composed tree:\n{}", fold_panels::dump_tree(composed).dump(2));

    fold_core::shutdown_logging();
    return 0;
}
