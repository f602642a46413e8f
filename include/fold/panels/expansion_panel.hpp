/// @file expansion_panel.hpp
/// @brief Expansion panels and the list laying them out

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "node.hpp"

#include <fold/anim/curves.hpp>
#include <fold/anim/types.hpp>
#include <fold/core/error.hpp>

#include <cstddef>
#include <functional>
#include <vector>

namespace fold_panels {

// =============================================================================
// Callbacks
// =============================================================================

/// @brief Information handed to header builders
struct BuildContext {
    std::size_t panel_index{0};
    std::size_t panel_count{0};
};

/// @brief Builds a header from the context and the panel's expansion state
using HeaderBuilder = std::function<Node(const BuildContext&, bool)>;

/// @brief Toggle request: (panel index, requested expansion state)
using ExpansionCallback = std::function<void(std::size_t, bool)>;

// =============================================================================
// ExpansionPanel
// =============================================================================

/// @brief One panel: a header builder, a body and an expansion flag.
///
/// Immutable. A moved-from panel has no header and no body and is rejected
/// by ExpansionPanelList::create.
class ExpansionPanel {
public:
    /// @brief Validated construction; header and body are required
    [[nodiscard]] static fold_core::Result<ExpansionPanel> create(HeaderBuilder header_builder, Node body,
                                                                  bool is_expanded = false);

    ExpansionPanel(const ExpansionPanel&) = default;
    ExpansionPanel& operator=(const ExpansionPanel&) = default;
    ExpansionPanel(ExpansionPanel&& other) noexcept;
    ExpansionPanel& operator=(ExpansionPanel&& other) noexcept;

    /// @brief Copy with another expansion flag
    [[nodiscard]] ExpansionPanel with_expanded(bool expanded) const;

    const HeaderBuilder& header_builder() const { return m_header_builder; }
    const Node& body() const { return m_body; }
    bool is_expanded() const { return m_expanded; }

    /// @brief Header builder present and body not null
    bool is_valid() const { return static_cast<bool>(m_header_builder) && !m_body.is_null(); }

private:
    ExpansionPanel(HeaderBuilder header_builder, Node body, bool is_expanded);

    HeaderBuilder m_header_builder;
    Node m_body;
    bool m_expanded{false};
};

// =============================================================================
// ExpansionPanelList
// =============================================================================

/// @brief Lays out panels as slices of one mergeable surface.
///
/// Holds no expansion state of its own: a toggle only reports the request
/// through the callback and the caller builds a new list with updated
/// panels. For panel i:
/// - a gap keyed 2i-1 precedes the slice when i is expanded, i > 0 and
///   panel i-1 is collapsed,
/// - the slice is keyed 2i,
/// - a gap keyed 2i+1 follows the slice when i is expanded and not last.
class ExpansionPanelList {
public:
    /// @param animation_duration Seconds, finite and >= 0
    /// @param curve Curve for header margin and body cross fade (fast-out-slow-in when null)
    [[nodiscard]] static fold_core::Result<ExpansionPanelList> create(
        std::vector<ExpansionPanel> panels,
        ExpansionCallback on_toggle = nullptr,
        float animation_duration = fold_anim::kThemeAnimationDuration,
        fold_anim::CurvePtr curve = nullptr);

    /// @brief Declared tree: MergeableSurface of slices and gaps
    [[nodiscard]] Node build(const BuildContext& context) const;

    /// @brief Number of gaps build() emits
    [[nodiscard]] std::size_t gap_count() const;

    /// @brief Perform the toggle action of panel index
    /// @throws std::out_of_range if index >= size()
    void toggle(std::size_t index) const;

    const std::vector<ExpansionPanel>& panels() const { return m_panels; }
    std::size_t size() const { return m_panels.size(); }
    float animation_duration() const { return m_duration; }
    const fold_anim::CurvePtr& curve() const { return m_curve; }
    bool has_toggle_callback() const { return static_cast<bool>(m_on_toggle); }

private:
    ExpansionPanelList(std::vector<ExpansionPanel> panels, ExpansionCallback on_toggle,
                       float duration, fold_anim::CurvePtr curve);

    bool has_leading_gap(std::size_t index) const;
    bool has_trailing_gap(std::size_t index) const;
    Node build_slice(const BuildContext& context, std::size_t index) const;

    std::vector<ExpansionPanel> m_panels;
    ExpansionCallback m_on_toggle;
    float m_duration;
    fold_anim::CurvePtr m_curve;
};

} // namespace fold_panels
