#pragma once

/// @file log.hpp
/// @brief Logging utilities for fold

#include "fwd.hpp"

#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

// =============================================================================
// Logging Macros
// =============================================================================

#define FOLD_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define FOLD_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define FOLD_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define FOLD_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define FOLD_LOG_ERROR(...) spdlog::error(__VA_ARGS__)
#define FOLD_LOG_CRITICAL(...) spdlog::critical(__VA_ARGS__)

namespace fold_core {

// =============================================================================
// Log Configuration
// =============================================================================

/// Configuration for the logging system
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 5 * 1024 * 1024;  // 5 MB
    std::size_t max_files = 3;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Apply a configuration to the default logger and every named logger.
/// Sinks of loggers created before the call are rebuilt.
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Logger for panel construction and component lifecycle
std::shared_ptr<spdlog::logger> panels_logger();

/// Logger for controllers and the frame scheduler
std::shared_ptr<spdlog::logger> anim_logger();

// =============================================================================
// Log Level Management
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level);

spdlog::level::level_enum get_global_log_level();

/// Parse log level from string ("trace" .. "critical", "off")
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers();

/// Flush and drop every logger created through get_logger
void shutdown_logging();

} // namespace fold_core
