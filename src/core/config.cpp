/// @file config.cpp
/// @brief JSON configuration loading for fold_core

#include <fold/core/config.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>

namespace fold_core {

namespace {

/// Read a float key, rejecting non-numeric values
Result<float> read_float(const nlohmann::json& j, const char* key, float fallback) {
    if (!j.contains(key)) {
        return Ok(fallback);
    }
    const auto& v = j[key];
    if (!v.is_number()) {
        return Err<float>(ConfigError::invalid_value(key, "expected a number"));
    }
    return Ok(v.get<float>());
}

/// Read a non-negative integer key; negative or fractional values are rejected
Result<std::size_t> read_size(const nlohmann::json& j, const char* key, const std::string& full_key,
                              std::size_t fallback) {
    if (!j.contains(key)) {
        return Ok(fallback);
    }
    const auto& v = j[key];
    if (!v.is_number_unsigned()) {
        return Err<std::size_t>(ConfigError::invalid_value(full_key, "expected a non-negative integer"));
    }
    return Ok(v.get<std::size_t>());
}

Result<void> parse_log_section(const nlohmann::json& j, LogConfig& log) {
    if (!j.is_object()) {
        return Err(ConfigError::invalid_value("log", "expected an object"));
    }

    std::string level = j.value("level", std::string(log_level_name(log.level)));
    auto parsed = parse_log_level(level);
    if (!parsed) {
        return Err(ConfigError::invalid_value("log.level", "unknown level '" + level + "'"));
    }
    log.level = *parsed;

    log.console_enabled = j.value("console", log.console_enabled);
    log.file_enabled = j.value("file", log.file_enabled);
    log.log_directory = j.value("directory", log.log_directory);

    auto max_file_size = read_size(j, "max_file_size", "log.max_file_size", log.max_file_size);
    if (!max_file_size) return Err(max_file_size.error());
    log.max_file_size = *max_file_size;

    auto max_files = read_size(j, "max_files", "log.max_files", log.max_files);
    if (!max_files) return Err(max_files.error());
    log.max_files = *max_files;
    return Ok();
}

} // anonymous namespace

// =============================================================================
// Curve Names
// =============================================================================

const std::vector<std::string>& curve_names() {
    static const std::vector<std::string> names = {
        "linear", "ease", "ease_in", "ease_out", "ease_in_out",
        "fast_out_slow_in", "decelerate", "bounce_out",
    };
    return names;
}

// =============================================================================
// Parsing
// =============================================================================

Result<FoldConfig> parse_config(std::string_view text) {
    FoldConfig config;

    try {
        auto j = nlohmann::json::parse(text);
        if (!j.is_object()) {
            return Err<FoldConfig>(ConfigError::parse_failed("top level must be an object"));
        }

        auto duration = read_float(j, "animation_duration", config.animation_duration);
        if (!duration) return Err<FoldConfig>(duration.error());
        config.animation_duration = *duration;

        auto dilation = read_float(j, "time_dilation", config.time_dilation);
        if (!dilation) return Err<FoldConfig>(dilation.error());
        config.time_dilation = *dilation;

        if (j.contains("curve")) {
            if (!j["curve"].is_string()) {
                return Err<FoldConfig>(ConfigError::invalid_value("curve", "expected a string"));
            }
            config.curve = j["curve"].get<std::string>();
        }

        if (j.contains("log")) {
            auto log_result = parse_log_section(j["log"], config.log);
            if (!log_result) return Err<FoldConfig>(log_result.error());
        }
    } catch (const nlohmann::json::parse_error& e) {
        return Err<FoldConfig>(ConfigError::parse_failed(e.what()));
    } catch (const nlohmann::json::exception& e) {
        // Type mismatches inside j.value(...)
        return Err<FoldConfig>(ConfigError::invalid_value("log", e.what()));
    }

    auto valid = validate_config(config);
    if (!valid) {
        return Err<FoldConfig>(valid.error());
    }
    return Ok(std::move(config));
}

Result<FoldConfig> load_config_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<FoldConfig>(ConfigError::file_not_found(path));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = parse_config(buffer.str());
    if (!result) {
        Error err = result.error();
        err.with_context("path", path);
        return Err<FoldConfig>(std::move(err));
    }
    return result;
}

// =============================================================================
// Serialization
// =============================================================================

nlohmann::json config_to_json(const FoldConfig& config) {
    nlohmann::json j;
    j["animation_duration"] = config.animation_duration;
    j["time_dilation"] = config.time_dilation;
    j["curve"] = config.curve;
    j["log"] = {
        {"level", log_level_name(config.log.level)},
        {"console", config.log.console_enabled},
        {"file", config.log.file_enabled},
        {"directory", config.log.log_directory},
        {"max_file_size", config.log.max_file_size},
        {"max_files", config.log.max_files},
    };
    return j;
}

// =============================================================================
// Validation
// =============================================================================

Result<void> validate_config(const FoldConfig& config) {
    if (!std::isfinite(config.animation_duration) || config.animation_duration < 0.0f) {
        return Err(ConfigError::invalid_value("animation_duration", "must be a finite value >= 0"));
    }
    if (!std::isfinite(config.time_dilation) || config.time_dilation <= 0.0f) {
        return Err(ConfigError::invalid_value("time_dilation", "must be a finite value > 0"));
    }
    if (config.curve.empty()) {
        return Err(ConfigError::invalid_value("curve", "must name a curve"));
    }
    const auto& names = curve_names();
    if (std::find(names.begin(), names.end(), config.curve) == names.end()) {
        return Err(ConfigError::invalid_value("curve", "unknown curve '" + config.curve + "'"));
    }
    if (config.log.file_enabled && config.log.log_directory.empty()) {
        return Err(ConfigError::invalid_value("log.directory", "required when file logging is enabled"));
    }
    return Ok();
}

} // namespace fold_core
