#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for fold_core

#include <cstdint>

namespace fold_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct ValidationError;
struct ConfigError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;

// =============================================================================
// Configuration
// =============================================================================

struct FoldConfig;

} // namespace fold_core
