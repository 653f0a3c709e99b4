#pragma once

/// @file log.hpp
/// @brief Logging utilities for tableau_engine
///
/// Each module logs through its own named spdlog logger. All named loggers
/// share the sinks and level set by configure_logging().

#include <spdlog/spdlog.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace tableau_core {

// =============================================================================
// Log Configuration
// =============================================================================

/// Configuration for the logging system
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Apply sink and level settings. Existing loggers take the new level;
/// sink changes affect loggers created afterwards.
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Logger for the scene graph
std::shared_ptr<spdlog::logger> scene_logger();

/// Logger for layer sets and compositing
std::shared_ptr<spdlog::logger> compositor_logger();

// =============================================================================
// Level Names
// =============================================================================

/// Parse "trace".."critical" or "off" (plus "warning", "err", "fatal")
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(std::string_view str);

[[nodiscard]] const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Lifecycle
// =============================================================================

/// Flush and drop every named logger
void shutdown_logging();

} // namespace tableau_core
