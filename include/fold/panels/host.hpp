/// @file host.hpp
/// @brief Component host resolving stateful nodes of a declared tree

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "node.hpp"
#include "implicit.hpp"

#include <fold/anim/ticker.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace fold_panels {

// =============================================================================
// IStatefulComponent Interface
// =============================================================================

/// @brief Retained state behind a stateful node.
///
/// Created (mounted) the first time its path appears in a composition,
/// updated on each following composition and destroyed (unmounted) when
/// the path disappears.
class IStatefulComponent {
public:
    virtual ~IStatefulComponent() = default;

    /// @brief Kind of node this component resolves
    virtual NodeKind kind() const = 0;

    /// @brief New declared properties (not called for the mounting composition)
    virtual void update(const Node& declared) = 0;

    /// @brief Concrete node for the current state; its children are composed afterwards
    virtual Node build(const Node& declared) = 0;

    /// @brief Called with the built node once its children are composed
    virtual void layout(Node& composed) { (void)composed; }
};

using ComponentFactory =
    std::function<std::unique_ptr<IStatefulComponent>(fold_anim::FrameScheduler&, const Node&)>;

// =============================================================================
// Built-in Components
// =============================================================================

/// @brief AnimatedSize: size converging to the composed child's size
class AnimatedSizeComponent : public IStatefulComponent {
public:
    AnimatedSizeComponent(fold_anim::FrameScheduler& scheduler, const Node& declared);

    NodeKind kind() const override { return NodeKind::AnimatedSize; }
    void update(const Node& declared) override;
    Node build(const Node& declared) override;
    void layout(Node& composed) override;

    /// @brief Size shown right now (child size before the first layout)
    Size current_size() const;
    bool is_animating() const { return m_tween && m_tween->is_animating(); }

private:
    fold_anim::FrameScheduler& m_scheduler;
    float m_duration;
    fold_anim::CurvePtr m_curve;
    std::unique_ptr<ImplicitTween<Size>> m_tween;
};

/// @brief AnimatedContainer: margin tweened towards the declared margin
class AnimatedContainerComponent : public IStatefulComponent {
public:
    AnimatedContainerComponent(fold_anim::FrameScheduler& scheduler, const Node& declared);

    NodeKind kind() const override { return NodeKind::AnimatedContainer; }
    void update(const Node& declared) override;
    Node build(const Node& declared) override;

    Insets current_margin() const { return m_margin.value(); }
    bool is_animating() const { return m_margin.is_animating(); }

private:
    ImplicitTween<Insets> m_margin;
};

// =============================================================================
// ComponentHost
// =============================================================================

/// @brief Resolves stateful nodes and keeps their state between compositions.
///
/// A component's identity is its path: the kinds of its ancestors plus each
/// one's key, or its index among siblings when unkeyed, e.g.
/// "/MergeableSurface@0/Slice#2/Column@0/CrossFade@1".
class ComponentHost {
public:
    explicit ComponentHost(fold_anim::FrameScheduler& scheduler);
    ~ComponentHost();

    ComponentHost(const ComponentHost&) = delete;
    ComponentHost& operator=(const ComponentHost&) = delete;

    /// @brief Replace the factory for a stateful kind
    void register_factory(NodeKind kind, ComponentFactory factory);

    /// @brief Resolve a declared tree, mounting, updating and unmounting components
    Node compose(const Node& declared);

    /// @brief Unmount every component
    void unmount_all();

    std::size_t mounted_count() const { return m_components.size(); }
    bool is_mounted(const std::string& path) const;

    /// @brief Component at a path, or nullptr
    IStatefulComponent* component(const std::string& path) const;

    /// @brief Mounted paths in lexical order
    std::vector<std::string> mounted_paths() const;

    /// @brief Mounted components of a kind, in path order
    std::vector<IStatefulComponent*> find_components(NodeKind kind) const;

    fold_anim::FrameScheduler& scheduler() const { return m_scheduler; }

    std::uint64_t composition_count() const { return m_composition_count; }

private:
    Node compose_node(const Node& declared, const std::string& parent_path, std::size_t index,
                      std::vector<std::string>& seen);
    IStatefulComponent& resolve(const Node& declared, const std::string& path);

    fold_anim::FrameScheduler& m_scheduler;
    std::unordered_map<NodeKind, ComponentFactory> m_factories;
    std::map<std::string, std::unique_ptr<IStatefulComponent>> m_components;
    std::uint64_t m_composition_count{0};
};

/// @brief Path segment of a node: kind name plus "#key" or "@index"
[[nodiscard]] std::string path_segment(const Node& node, std::size_t index);

} // namespace fold_panels
