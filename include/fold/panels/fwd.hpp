/// @file fwd.hpp
/// @brief Forward declarations for fold_panels module

#pragma once

#include <cstdint>

namespace fold_panels {

/// @brief Sibling-unique identity of a node
using NodeKey = std::int64_t;

// =============================================================================
// Forward Declarations - Values
// =============================================================================

struct Size;
struct Insets;
struct PositionedOffsets;
enum class AnchorPoint : std::uint8_t;
enum class CrossFadeState : std::uint8_t;

// =============================================================================
// Forward Declarations - Node Tree
// =============================================================================

enum class NodeKind : std::uint8_t;
struct Node;
struct CrossFadeSpec;

// =============================================================================
// Forward Declarations - Components
// =============================================================================

class IStatefulComponent;
class ComponentHost;
class AnimatedSizeComponent;
class AnimatedContainerComponent;
class CrossFadeTransition;

template<typename T>
class ImplicitTween;

// =============================================================================
// Forward Declarations - Panels
// =============================================================================

struct BuildContext;
class ExpansionPanel;
class ExpansionPanelList;

} // namespace fold_panels
