/// @file layout.hpp
/// @brief Intrinsic measurement of node trees

#pragma once

#include "fwd.hpp"
#include "types.hpp"

namespace fold_panels {

/// @brief Intrinsic size of a node.
///
/// Columns and surfaces sum heights, rows sum widths, margins add their
/// insets and stacks take the largest non-positioned child. A CrossFade that
/// has not been composed measures as the child it is showing.
[[nodiscard]] Size measure(const Node& node);

} // namespace fold_panels
