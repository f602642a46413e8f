/// @file node.hpp
/// @brief Declarative node tree for fold_panels module

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <fold/anim/curves.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fold_panels {

// =============================================================================
// NodeKind
// =============================================================================

/// @brief Kind of a declared node
enum class NodeKind : std::uint8_t {
    None,               ///< Null node (nothing declared)
    Content,            ///< Leaf with a label and an intrinsic size
    SizedBox,           ///< Forces width and/or height
    Column,             ///< Children stacked vertically
    Row,                ///< Children laid out horizontally
    Flexible,           ///< Row child taking the remaining width
    Margin,             ///< Insets around a child
    AnimatedContainer,  ///< Margin animated implicitly (stateful)
    ExpandIcon,         ///< Toggle control with a pressed action
    Stack,              ///< Children layered on top of each other
    Opacity,            ///< Child drawn with an opacity
    ClipRect,           ///< Clips the child to its own bounds
    AnimatedSize,       ///< Size converging to the child's size (stateful)
    CrossFade,          ///< Cross fade between two children (stateful)
    MergeableSurface,   ///< Surface holding slices and gaps
    Slice,              ///< One panel inside a mergeable surface
    Gap                 ///< Visual break between slices
};

[[nodiscard]] const char* node_kind_name(NodeKind kind);

/// @brief True for kinds resolved by a ComponentHost
[[nodiscard]] bool is_stateful_kind(NodeKind kind);

// =============================================================================
// Node
// =============================================================================

/// @brief A declared node. Only the properties relevant to its kind are used.
struct Node {
    NodeKind kind{NodeKind::None};
    std::optional<NodeKey> key;

    // Content
    std::string label;
    Size content_size;

    // SizedBox / AnimatedSize / Gap
    std::optional<float> width;
    std::optional<float> height;

    // Margin / AnimatedContainer margin / ExpandIcon padding
    Insets insets;

    // Opacity
    float opacity{1.0f};

    // Set on stack children drawn over the others
    std::optional<PositionedOffsets> position;

    // Stack / AnimatedSize
    AnchorPoint alignment{AnchorPoint::TopLeft};

    // ExpandIcon
    bool expanded{false};
    std::function<void()> on_pressed;

    // MergeableSurface
    bool has_dividers{false};

    // Animated kinds
    float duration{0};
    fold_anim::CurvePtr curve;

    // CrossFade
    std::shared_ptr<const CrossFadeSpec> cross_fade;

    std::vector<Node> children;

    [[nodiscard]] bool is_null() const { return kind == NodeKind::None; }
    [[nodiscard]] bool is_positioned() const { return position.has_value(); }
};

/// @brief Properties of a CrossFade node
struct CrossFadeSpec {
    Node first;
    Node second;
    CrossFadeState state{CrossFadeState::ShowFirst};
    float duration{0};
    fold_anim::CurvePtr curve;
};

// =============================================================================
// Node Factories
// =============================================================================

namespace nodes {

Node content(std::string label, Size size);
Node sized_box(std::optional<float> width, std::optional<float> height, Node child = {});
Node column(std::vector<Node> children);
Node row(std::vector<Node> children);
Node flexible(Node child);
Node margin(Insets insets, Node child);
Node animated_container(float duration, fold_anim::CurvePtr curve, Insets margin, Node child);
Node expand_icon(bool expanded, float padding, std::function<void()> on_pressed);
Node stack(std::vector<Node> children, AnchorPoint alignment = AnchorPoint::TopLeft);
Node positioned(PositionedOffsets offsets, Node child);
Node opacity(float value, Node child);
Node clip_rect(Node child);
Node animated_size(float duration, fold_anim::CurvePtr curve, AnchorPoint alignment, Node child);
Node cross_fade(CrossFadeSpec spec);
Node mergeable_surface(std::vector<Node> children, bool has_dividers);
Node slice(NodeKey key, Node child);
Node gap(NodeKey key, float size = kPanelGapSize);

/// @brief Copy of node with a key
Node keyed(NodeKey key, Node node);

} // namespace nodes

// =============================================================================
// Tree Utilities
// =============================================================================

/// @brief Compare two trees, ignoring callbacks (only their presence counts)
[[nodiscard]] bool structurally_equal(const Node& a, const Node& b);

/// @brief Depth-first search, also visiting both children of CrossFade specs
[[nodiscard]] const Node* find_first(const Node& root, NodeKind kind);
[[nodiscard]] std::vector<const Node*> find_all(const Node& root, NodeKind kind);
[[nodiscard]] std::size_t count_kind(const Node& root, NodeKind kind);

/// @brief Direct children of the given kind, in order
[[nodiscard]] std::vector<const Node*> children_of_kind(const Node& node, NodeKind kind);

/// @brief JSON rendering of a tree for debugging and logs
[[nodiscard]] nlohmann::json dump_tree(const Node& root);

} // namespace fold_panels
