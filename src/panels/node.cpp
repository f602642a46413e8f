/// @file node.cpp
/// @brief Node factories and tree utilities for fold_panels module

#include "fold/panels/node.hpp"

#include <nlohmann/json.hpp>

namespace fold_panels {

// =============================================================================
// Names
// =============================================================================

const char* node_kind_name(NodeKind kind) {
    switch (kind) {
        case NodeKind::None: return "None";
        case NodeKind::Content: return "Content";
        case NodeKind::SizedBox: return "SizedBox";
        case NodeKind::Column: return "Column";
        case NodeKind::Row: return "Row";
        case NodeKind::Flexible: return "Flexible";
        case NodeKind::Margin: return "Margin";
        case NodeKind::AnimatedContainer: return "AnimatedContainer";
        case NodeKind::ExpandIcon: return "ExpandIcon";
        case NodeKind::Stack: return "Stack";
        case NodeKind::Opacity: return "Opacity";
        case NodeKind::ClipRect: return "ClipRect";
        case NodeKind::AnimatedSize: return "AnimatedSize";
        case NodeKind::CrossFade: return "CrossFade";
        case NodeKind::MergeableSurface: return "MergeableSurface";
        case NodeKind::Slice: return "Slice";
        case NodeKind::Gap: return "Gap";
        default: return "Unknown";
    }
}

bool is_stateful_kind(NodeKind kind) {
    return kind == NodeKind::AnimatedContainer ||
           kind == NodeKind::AnimatedSize ||
           kind == NodeKind::CrossFade;
}

const char* anchor_point_name(AnchorPoint anchor) {
    switch (anchor) {
        case AnchorPoint::TopLeft: return "TopLeft";
        case AnchorPoint::TopCenter: return "TopCenter";
        case AnchorPoint::TopRight: return "TopRight";
        case AnchorPoint::MiddleLeft: return "MiddleLeft";
        case AnchorPoint::MiddleCenter: return "MiddleCenter";
        case AnchorPoint::MiddleRight: return "MiddleRight";
        case AnchorPoint::BottomLeft: return "BottomLeft";
        case AnchorPoint::BottomCenter: return "BottomCenter";
        case AnchorPoint::BottomRight: return "BottomRight";
        default: return "Unknown";
    }
}

const char* cross_fade_state_name(CrossFadeState state) {
    switch (state) {
        case CrossFadeState::ShowFirst: return "ShowFirst";
        case CrossFadeState::ShowSecond: return "ShowSecond";
        default: return "Unknown";
    }
}

// =============================================================================
// Node Factories
// =============================================================================

namespace nodes {

namespace {

Node make(NodeKind kind) {
    Node node;
    node.kind = kind;
    return node;
}

Node wrap(NodeKind kind, Node child) {
    Node node = make(kind);
    node.children.push_back(std::move(child));
    return node;
}

} // anonymous namespace

Node content(std::string label, Size size) {
    Node node = make(NodeKind::Content);
    node.label = std::move(label);
    node.content_size = size;
    return node;
}

Node sized_box(std::optional<float> width, std::optional<float> height, Node child) {
    Node node = make(NodeKind::SizedBox);
    node.width = width;
    node.height = height;
    if (!child.is_null()) {
        node.children.push_back(std::move(child));
    }
    return node;
}

Node column(std::vector<Node> children) {
    Node node = make(NodeKind::Column);
    node.children = std::move(children);
    return node;
}

Node row(std::vector<Node> children) {
    Node node = make(NodeKind::Row);
    node.children = std::move(children);
    return node;
}

Node flexible(Node child) {
    return wrap(NodeKind::Flexible, std::move(child));
}

Node margin(Insets insets, Node child) {
    Node node = wrap(NodeKind::Margin, std::move(child));
    node.insets = insets;
    return node;
}

Node animated_container(float duration, fold_anim::CurvePtr curve, Insets margin, Node child) {
    Node node = wrap(NodeKind::AnimatedContainer, std::move(child));
    node.duration = duration;
    node.curve = std::move(curve);
    node.insets = margin;
    return node;
}

Node expand_icon(bool expanded, float padding, std::function<void()> on_pressed) {
    Node node = make(NodeKind::ExpandIcon);
    node.expanded = expanded;
    node.insets = Insets(padding);
    node.on_pressed = std::move(on_pressed);
    return node;
}

Node stack(std::vector<Node> children, AnchorPoint alignment) {
    Node node = make(NodeKind::Stack);
    node.children = std::move(children);
    node.alignment = alignment;
    return node;
}

Node positioned(PositionedOffsets offsets, Node child) {
    child.position = offsets;
    return child;
}

Node opacity(float value, Node child) {
    Node node = wrap(NodeKind::Opacity, std::move(child));
    node.opacity = value;
    return node;
}

Node clip_rect(Node child) {
    return wrap(NodeKind::ClipRect, std::move(child));
}

Node animated_size(float duration, fold_anim::CurvePtr curve, AnchorPoint alignment, Node child) {
    Node node = wrap(NodeKind::AnimatedSize, std::move(child));
    node.duration = duration;
    node.curve = std::move(curve);
    node.alignment = alignment;
    return node;
}

Node cross_fade(CrossFadeSpec spec) {
    Node node = make(NodeKind::CrossFade);
    node.duration = spec.duration;
    node.curve = spec.curve;
    node.cross_fade = std::make_shared<const CrossFadeSpec>(std::move(spec));
    return node;
}

Node mergeable_surface(std::vector<Node> children, bool has_dividers) {
    Node node = make(NodeKind::MergeableSurface);
    node.children = std::move(children);
    node.has_dividers = has_dividers;
    return node;
}

Node slice(NodeKey key, Node child) {
    Node node = wrap(NodeKind::Slice, std::move(child));
    node.key = key;
    return node;
}

Node gap(NodeKey key, float size) {
    Node node = make(NodeKind::Gap);
    node.key = key;
    node.height = size;
    return node;
}

Node keyed(NodeKey key, Node node) {
    node.key = key;
    return node;
}

} // namespace nodes

// =============================================================================
// Structural Comparison
// =============================================================================

namespace {

bool same_curve(const fold_anim::CurvePtr& a, const fold_anim::CurvePtr& b) {
    if (a == b) return true;
    if (!a || !b) return false;
    return a->describe() == b->describe();
}

bool same_spec(const std::shared_ptr<const CrossFadeSpec>& a,
               const std::shared_ptr<const CrossFadeSpec>& b) {
    if (a == b) return true;
    if (!a || !b) return false;
    return a->state == b->state &&
           a->duration == b->duration &&
           same_curve(a->curve, b->curve) &&
           structurally_equal(a->first, b->first) &&
           structurally_equal(a->second, b->second);
}

} // anonymous namespace

bool structurally_equal(const Node& a, const Node& b) {
    if (a.kind != b.kind || a.key != b.key) return false;
    if (a.label != b.label || !(a.content_size == b.content_size)) return false;
    if (a.width != b.width || a.height != b.height) return false;
    if (!(a.insets == b.insets) || a.opacity != b.opacity) return false;
    if (a.position != b.position || a.alignment != b.alignment) return false;
    if (a.expanded != b.expanded || a.has_dividers != b.has_dividers) return false;
    if (static_cast<bool>(a.on_pressed) != static_cast<bool>(b.on_pressed)) return false;
    if (a.duration != b.duration || !same_curve(a.curve, b.curve)) return false;
    if (!same_spec(a.cross_fade, b.cross_fade)) return false;

    if (a.children.size() != b.children.size()) return false;
    for (std::size_t i = 0; i < a.children.size(); ++i) {
        if (!structurally_equal(a.children[i], b.children[i])) return false;
    }
    return true;
}

// =============================================================================
// Search
// =============================================================================

namespace {

template<typename Visitor>
bool walk(const Node& node, Visitor&& visitor) {
    if (!visitor(node)) return false;
    if (node.cross_fade) {
        if (!walk(node.cross_fade->first, visitor)) return false;
        if (!walk(node.cross_fade->second, visitor)) return false;
    }
    for (const auto& child : node.children) {
        if (!walk(child, visitor)) return false;
    }
    return true;
}

} // anonymous namespace

const Node* find_first(const Node& root, NodeKind kind) {
    const Node* found = nullptr;
    walk(root, [&](const Node& node) {
        if (node.kind == kind) {
            found = &node;
            return false;
        }
        return true;
    });
    return found;
}

std::vector<const Node*> find_all(const Node& root, NodeKind kind) {
    std::vector<const Node*> found;
    walk(root, [&](const Node& node) {
        if (node.kind == kind) {
            found.push_back(&node);
        }
        return true;
    });
    return found;
}

std::size_t count_kind(const Node& root, NodeKind kind) {
    return find_all(root, kind).size();
}

std::vector<const Node*> children_of_kind(const Node& node, NodeKind kind) {
    std::vector<const Node*> found;
    for (const auto& child : node.children) {
        if (child.kind == kind) {
            found.push_back(&child);
        }
    }
    return found;
}

// =============================================================================
// JSON Dump
// =============================================================================

nlohmann::json dump_tree(const Node& root) {
    nlohmann::json j;
    j["kind"] = node_kind_name(root.kind);
    if (root.key) j["key"] = *root.key;

    switch (root.kind) {
        case NodeKind::Content:
            j["label"] = root.label;
            j["size"] = nlohmann::json::array({root.content_size.width, root.content_size.height});
            break;
        case NodeKind::SizedBox:
        case NodeKind::Gap:
            if (root.width) j["width"] = *root.width;
            if (root.height) j["height"] = *root.height;
            break;
        case NodeKind::Margin:
            j["insets"] = nlohmann::json::array({root.insets.left, root.insets.top, root.insets.right, root.insets.bottom});
            break;
        case NodeKind::AnimatedContainer:
            j["margin"] = nlohmann::json::array({root.insets.left, root.insets.top, root.insets.right, root.insets.bottom});
            j["duration"] = root.duration;
            if (root.curve) j["curve"] = root.curve->describe();
            break;
        case NodeKind::ExpandIcon:
            j["expanded"] = root.expanded;
            j["padding"] = root.insets.left;
            j["enabled"] = static_cast<bool>(root.on_pressed);
            break;
        case NodeKind::Stack:
            j["alignment"] = anchor_point_name(root.alignment);
            break;
        case NodeKind::Opacity:
            j["opacity"] = root.opacity;
            break;
        case NodeKind::AnimatedSize:
            j["alignment"] = anchor_point_name(root.alignment);
            j["duration"] = root.duration;
            if (root.width) j["width"] = *root.width;
            if (root.height) j["height"] = *root.height;
            break;
        case NodeKind::CrossFade:
            if (root.cross_fade) {
                j["state"] = cross_fade_state_name(root.cross_fade->state);
                j["duration"] = root.cross_fade->duration;
                j["first"] = dump_tree(root.cross_fade->first);
                j["second"] = dump_tree(root.cross_fade->second);
            }
            break;
        case NodeKind::MergeableSurface:
            j["has_dividers"] = root.has_dividers;
            break;
        default:
            break;
    }

    if (root.position) {
        auto& pos = j["position"];
        pos = nlohmann::json::object();
        if (root.position->left) pos["left"] = *root.position->left;
        if (root.position->top) pos["top"] = *root.position->top;
        if (root.position->right) pos["right"] = *root.position->right;
        if (root.position->bottom) pos["bottom"] = *root.position->bottom;
    }

    if (!root.children.empty()) {
        auto& children = j["children"];
        children = nlohmann::json::array();
        for (const auto& child : root.children) {
            children.push_back(dump_tree(child));
        }
    }
    return j;
}

} // namespace fold_panels
