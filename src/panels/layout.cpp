/// @file layout.cpp
/// @brief Intrinsic measurement of node trees

#include "fold/panels/layout.hpp"
#include "fold/panels/node.hpp"

#include <algorithm>

namespace fold_panels {

namespace {

Size measure_vertical(const std::vector<Node>& children) {
    Size total;
    for (const auto& child : children) {
        Size s = measure(child);
        total.width = std::max(total.width, s.width);
        total.height += s.height;
    }
    return total;
}

Size measure_horizontal(const std::vector<Node>& children) {
    Size total;
    for (const auto& child : children) {
        Size s = measure(child);
        total.width += s.width;
        total.height = std::max(total.height, s.height);
    }
    return total;
}

Size measure_single(const Node& node) {
    return node.children.empty() ? Size::zero() : measure(node.children.front());
}

Size apply_insets(Size size, const Insets& insets) {
    return {size.width + insets.horizontal(), size.height + insets.vertical()};
}

} // anonymous namespace

Size measure(const Node& node) {
    switch (node.kind) {
        case NodeKind::None:
            return Size::zero();

        case NodeKind::Content:
            return node.content_size;

        case NodeKind::SizedBox:
        case NodeKind::AnimatedSize: {
            Size s = measure_single(node);
            if (node.width) s.width = *node.width;
            if (node.height) s.height = *node.height;
            return s;
        }

        case NodeKind::Column:
        case NodeKind::MergeableSurface:
            return measure_vertical(node.children);

        case NodeKind::Row:
            return measure_horizontal(node.children);

        case NodeKind::Margin:
        case NodeKind::AnimatedContainer:
            return apply_insets(measure_single(node), node.insets);

        case NodeKind::ExpandIcon:
            return apply_insets(Size(kExpandIconSize, kExpandIconSize), node.insets);

        case NodeKind::Stack: {
            Size s;
            for (const auto& child : node.children) {
                if (child.is_positioned()) continue;
                Size c = measure(child);
                s.width = std::max(s.width, c.width);
                s.height = std::max(s.height, c.height);
            }
            return s;
        }

        case NodeKind::CrossFade:
            if (!node.cross_fade) return Size::zero();
            return node.cross_fade->state == CrossFadeState::ShowSecond
                ? measure(node.cross_fade->second)
                : measure(node.cross_fade->first);

        case NodeKind::Gap:
            return {node.width.value_or(0.0f), node.height.value_or(kPanelGapSize)};

        case NodeKind::Flexible:
        case NodeKind::Opacity:
        case NodeKind::ClipRect:
        case NodeKind::Slice:
            return measure_single(node);

        default:
            return measure_single(node);
    }
}

} // namespace fold_panels
