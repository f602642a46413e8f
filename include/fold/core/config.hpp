#pragma once

/// @file config.hpp
/// @brief JSON configuration for fold

#include "fwd.hpp"
#include "error.hpp"
#include "log.hpp"

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace fold_core {

// =============================================================================
// FoldConfig
// =============================================================================

/// Runtime settings shared by the demo and tests.
///
/// Example file:
/// @code
/// {
///   "animation_duration": 0.2,
///   "time_dilation": 1.0,
///   "curve": "fast_out_slow_in",
///   "log": { "level": "info", "console": true, "file": false, "directory": "logs" }
/// }
/// @endcode
struct FoldConfig {
    float animation_duration = 0.2f;  // Seconds
    float time_dilation = 1.0f;       // Frame deltas are divided by this
    std::string curve = "fast_out_slow_in";
    LogConfig log;
};

/// Curve names accepted by the "curve" key
[[nodiscard]] const std::vector<std::string>& curve_names();

/// Parse configuration text. Missing keys keep their defaults.
[[nodiscard]] Result<FoldConfig> parse_config(std::string_view text);

/// Read and parse a configuration file
[[nodiscard]] Result<FoldConfig> load_config_file(const std::string& path);

/// Serialize a configuration (inverse of parse_config)
[[nodiscard]] nlohmann::json config_to_json(const FoldConfig& config);

/// Check value ranges: duration finite and >= 0, dilation finite and > 0,
/// curve one of curve_names()
[[nodiscard]] Result<void> validate_config(const FoldConfig& config);

} // namespace fold_core
