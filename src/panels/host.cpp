/// @file host.cpp
/// @brief Implementation of ComponentHost and the implicit components

#include "fold/panels/host.hpp"
#include "fold/panels/cross_fade.hpp"
#include "fold/panels/layout.hpp"

#include <fold/core/log.hpp>

#include <algorithm>
#include <stdexcept>

namespace fold_panels {

// =============================================================================
// AnimatedSizeComponent
// =============================================================================

AnimatedSizeComponent::AnimatedSizeComponent(fold_anim::FrameScheduler& scheduler, const Node& declared)
    : m_scheduler(scheduler)
    , m_duration(declared.duration)
    , m_curve(declared.curve) {}

void AnimatedSizeComponent::update(const Node& declared) {
    m_duration = declared.duration;
    m_curve = declared.curve;
    if (m_tween) {
        m_tween->set_duration(m_duration);
        m_tween->set_curve(m_curve);
    }
}

Node AnimatedSizeComponent::build(const Node& declared) {
    Node out = declared;
    out.width.reset();
    out.height.reset();
    return out;
}

void AnimatedSizeComponent::layout(Node& composed) {
    Size child = composed.children.empty() ? Size::zero() : measure(composed.children.front());

    if (!m_tween) {
        // First layout: take the child's size without animating
        m_tween = std::make_unique<ImplicitTween<Size>>(m_scheduler, child, m_duration, m_curve);
    } else {
        m_tween->set_target(child);
    }

    Size shown = m_tween->value();
    composed.width = shown.width;
    composed.height = shown.height;
}

Size AnimatedSizeComponent::current_size() const {
    return m_tween ? m_tween->value() : Size::zero();
}

// =============================================================================
// AnimatedContainerComponent
// =============================================================================

AnimatedContainerComponent::AnimatedContainerComponent(fold_anim::FrameScheduler& scheduler, const Node& declared)
    : m_margin(scheduler, declared.insets, declared.duration, declared.curve) {}

void AnimatedContainerComponent::update(const Node& declared) {
    m_margin.set_duration(declared.duration);
    m_margin.set_curve(declared.curve);
    m_margin.set_target(declared.insets);
}

Node AnimatedContainerComponent::build(const Node& declared) {
    Node out = declared;
    out.insets = m_margin.value();
    return out;
}

// =============================================================================
// ComponentHost
// =============================================================================

std::string path_segment(const Node& node, std::size_t index) {
    std::string segment = "/";
    segment += node_kind_name(node.kind);
    if (node.key) {
        segment += "#" + std::to_string(*node.key);
    } else {
        segment += "@" + std::to_string(index);
    }
    return segment;
}

ComponentHost::ComponentHost(fold_anim::FrameScheduler& scheduler)
    : m_scheduler(scheduler) {
    register_factory(NodeKind::CrossFade, &CrossFadeTransition::create);
    register_factory(NodeKind::AnimatedSize,
        [](fold_anim::FrameScheduler& s, const Node& declared) -> std::unique_ptr<IStatefulComponent> {
            return std::make_unique<AnimatedSizeComponent>(s, declared);
        });
    register_factory(NodeKind::AnimatedContainer,
        [](fold_anim::FrameScheduler& s, const Node& declared) -> std::unique_ptr<IStatefulComponent> {
            return std::make_unique<AnimatedContainerComponent>(s, declared);
        });
}

ComponentHost::~ComponentHost() {
    unmount_all();
}

void ComponentHost::register_factory(NodeKind kind, ComponentFactory factory) {
    if (!is_stateful_kind(kind)) {
        throw std::invalid_argument(std::string("not a stateful node kind: ") + node_kind_name(kind));
    }
    m_factories[kind] = std::move(factory);
}

Node ComponentHost::compose(const Node& declared) {
    ++m_composition_count;

    std::vector<std::string> seen;
    Node composed = compose_node(declared, "", 0, seen);

    std::sort(seen.begin(), seen.end());
    for (auto it = m_components.begin(); it != m_components.end();) {
        if (!std::binary_search(seen.begin(), seen.end(), it->first)) {
            fold_core::panels_logger()->debug("unmount {}", it->first);
            it = m_components.erase(it);
        } else {
            ++it;
        }
    }
    return composed;
}

Node ComponentHost::compose_node(const Node& declared, const std::string& parent_path, std::size_t index,
                                 std::vector<std::string>& seen) {
    std::string path = parent_path + path_segment(declared, index);

    if (!is_stateful_kind(declared.kind)) {
        Node out = declared;
        for (std::size_t i = 0; i < out.children.size(); ++i) {
            out.children[i] = compose_node(declared.children[i], path, i, seen);
        }
        return out;
    }

    seen.push_back(path);
    IStatefulComponent& component = resolve(declared, path);

    Node out = component.build(declared);
    for (std::size_t i = 0; i < out.children.size(); ++i) {
        Node child = std::move(out.children[i]);
        out.children[i] = compose_node(child, path, i, seen);
    }
    component.layout(out);
    return out;
}

IStatefulComponent& ComponentHost::resolve(const Node& declared, const std::string& path) {
    auto it = m_components.find(path);
    if (it != m_components.end()) {
        it->second->update(declared);
        return *it->second;
    }

    auto factory = m_factories.find(declared.kind);
    if (factory == m_factories.end() || !factory->second) {
        throw std::invalid_argument(std::string("no component factory for ") + node_kind_name(declared.kind));
    }

    auto component = factory->second(m_scheduler, declared);
    fold_core::panels_logger()->debug("mount {}", path);
    auto& ref = *component;
    m_components.emplace(path, std::move(component));
    return ref;
}

void ComponentHost::unmount_all() {
    if (m_components.empty()) return;
    fold_core::panels_logger()->debug("unmounting {} component(s)", m_components.size());
    m_components.clear();
}

bool ComponentHost::is_mounted(const std::string& path) const {
    return m_components.find(path) != m_components.end();
}

IStatefulComponent* ComponentHost::component(const std::string& path) const {
    auto it = m_components.find(path);
    return it != m_components.end() ? it->second.get() : nullptr;
}

std::vector<std::string> ComponentHost::mounted_paths() const {
    std::vector<std::string> paths;
    paths.reserve(m_components.size());
    for (const auto& [path, component] : m_components) {
        paths.push_back(path);
    }
    return paths;
}

std::vector<IStatefulComponent*> ComponentHost::find_components(NodeKind kind) const {
    std::vector<IStatefulComponent*> found;
    for (const auto& [path, component] : m_components) {
        if (component->kind() == kind) {
            found.push_back(component.get());
        }
    }
    return found;
}

} // namespace fold_panels
