/// @file expansion_panel.cpp
/// @brief Implementation of ExpansionPanel and ExpansionPanelList

#include "fold/panels/expansion_panel.hpp"

#include <fold/core/log.hpp>

#include <cmath>
#include <string>
#include <utility>

namespace fold_panels {

namespace {

fold_core::Error report(fold_core::ValidationError err) {
    fold_core::Error error(std::move(err));
    fold_core::panels_logger()->error("{}", error.message());
    return error;
}

} // anonymous namespace

// =============================================================================
// ExpansionPanel
// =============================================================================

ExpansionPanel::ExpansionPanel(HeaderBuilder header_builder, Node body, bool is_expanded)
    : m_header_builder(std::move(header_builder))
    , m_body(std::move(body))
    , m_expanded(is_expanded) {}

ExpansionPanel::ExpansionPanel(ExpansionPanel&& other) noexcept
    : m_header_builder(std::exchange(other.m_header_builder, nullptr))
    , m_body(std::exchange(other.m_body, Node{}))
    , m_expanded(other.m_expanded) {}

ExpansionPanel& ExpansionPanel::operator=(ExpansionPanel&& other) noexcept {
    if (this != &other) {
        m_header_builder = std::exchange(other.m_header_builder, nullptr);
        m_body = std::exchange(other.m_body, Node{});
        m_expanded = other.m_expanded;
    }
    return *this;
}

fold_core::Result<ExpansionPanel> ExpansionPanel::create(HeaderBuilder header_builder, Node body,
                                                         bool is_expanded) {
    if (!header_builder) {
        return fold_core::Err<ExpansionPanel>(
            report(fold_core::ValidationError::missing_field("ExpansionPanel", "header_builder")));
    }
    if (body.is_null()) {
        return fold_core::Err<ExpansionPanel>(
            report(fold_core::ValidationError::missing_field("ExpansionPanel", "body")));
    }
    return fold_core::Ok(ExpansionPanel(std::move(header_builder), std::move(body), is_expanded));
}

ExpansionPanel ExpansionPanel::with_expanded(bool expanded) const {
    return ExpansionPanel(m_header_builder, m_body, expanded);
}

// =============================================================================
// ExpansionPanelList
// =============================================================================

ExpansionPanelList::ExpansionPanelList(std::vector<ExpansionPanel> panels, ExpansionCallback on_toggle,
                                       float duration, fold_anim::CurvePtr curve)
    : m_panels(std::move(panels))
    , m_on_toggle(std::move(on_toggle))
    , m_duration(duration)
    , m_curve(std::move(curve)) {}

fold_core::Result<ExpansionPanelList> ExpansionPanelList::create(std::vector<ExpansionPanel> panels,
                                                                 ExpansionCallback on_toggle,
                                                                 float animation_duration,
                                                                 fold_anim::CurvePtr curve) {
    if (!std::isfinite(animation_duration) || animation_duration < 0.0f) {
        return fold_core::Err<ExpansionPanelList>(report(fold_core::ValidationError::invalid_value(
            "ExpansionPanelList", "animation_duration",
            "expected a finite number of seconds >= 0, got " + std::to_string(animation_duration))));
    }

    for (std::size_t i = 0; i < panels.size(); ++i) {
        const auto& panel = panels[i];
        if (panel.is_valid()) continue;

        std::string reason = panel.header_builder() ? "panel has no body" : "panel has no header builder";
        auto error = report(fold_core::ValidationError::invalid_value(
            "ExpansionPanelList", "panels[" + std::to_string(i) + "]", reason));
        error.with_context("panel_index", std::to_string(i));
        return fold_core::Err<ExpansionPanelList>(std::move(error));
    }

    if (!curve) {
        curve = fold_anim::curves::fast_out_slow_in();
    }

    fold_core::panels_logger()->trace("panel list with {} panel(s), duration {}s",
                                      panels.size(), animation_duration);
    return fold_core::Ok(ExpansionPanelList(std::move(panels), std::move(on_toggle),
                                            animation_duration, std::move(curve)));
}

bool ExpansionPanelList::has_leading_gap(std::size_t index) const {
    return index > 0 && m_panels[index].is_expanded() && !m_panels[index - 1].is_expanded();
}

bool ExpansionPanelList::has_trailing_gap(std::size_t index) const {
    return m_panels[index].is_expanded() && index + 1 < m_panels.size();
}

std::size_t ExpansionPanelList::gap_count() const {
    std::size_t count = 0;
    for (std::size_t i = 0; i < m_panels.size(); ++i) {
        if (has_leading_gap(i)) ++count;
        if (has_trailing_gap(i)) ++count;
    }
    return count;
}

void ExpansionPanelList::toggle(std::size_t index) const {
    const auto& panel = m_panels.at(index);
    if (m_on_toggle) {
        m_on_toggle(index, !panel.is_expanded());
    }
}

Node ExpansionPanelList::build_slice(const BuildContext& context, std::size_t index) const {
    const auto& panel = m_panels[index];
    const bool expanded = panel.is_expanded();

    BuildContext header_context = context;
    header_context.panel_index = index;
    header_context.panel_count = m_panels.size();

    Insets header_margin = expanded ? Insets::symmetric(0.0f, kExpandedHeaderMargin) : Insets::zero();

    // The action captures what it needs by value so the node may outlive the list
    auto on_pressed = [callback = m_on_toggle, index, expanded]() {
        if (callback) {
            callback(index, !expanded);
        }
    };

    Node header = nodes::row({
        nodes::flexible(
            nodes::animated_container(m_duration, m_curve, header_margin,
                nodes::sized_box(std::nullopt, kCollapsedHeaderHeight,
                                 panel.header_builder()(header_context, expanded)))),
        nodes::margin(Insets::only_right(kToggleRightMargin),
                      nodes::expand_icon(expanded, kExpandIconPadding, std::move(on_pressed)))
    });

    CrossFadeSpec body;
    body.first = nodes::sized_box(std::nullopt, 0.0f);
    body.second = panel.body();
    body.state = expanded ? CrossFadeState::ShowSecond : CrossFadeState::ShowFirst;
    body.duration = m_duration;
    body.curve = m_curve;

    return nodes::slice(static_cast<NodeKey>(2 * index),
                        nodes::column({std::move(header), nodes::cross_fade(std::move(body))}));
}

Node ExpansionPanelList::build(const BuildContext& context) const {
    std::vector<Node> items;
    items.reserve(m_panels.size() + gap_count());

    for (std::size_t i = 0; i < m_panels.size(); ++i) {
        const auto key = static_cast<NodeKey>(2 * i);
        if (has_leading_gap(i)) {
            items.push_back(nodes::gap(key - 1));
        }
        items.push_back(build_slice(context, i));
        if (has_trailing_gap(i)) {
            items.push_back(nodes::gap(key + 1));
        }
    }

    return nodes::mergeable_surface(std::move(items), true);
}

} // namespace fold_panels
