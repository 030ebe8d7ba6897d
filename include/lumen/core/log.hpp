#pragma once

/// @file log.hpp
/// @brief Logging utilities for lumen

#include <spdlog/spdlog.h>
#include <string>
#include <memory>
#include <optional>

namespace lumen_core {

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

/// Configure logging system with full options
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Object store, reference counting and garbage collection
std::shared_ptr<spdlog::logger> resource_logger();

/// Shader preprocessing, compilation and program cache
std::shared_ptr<spdlog::logger> shader_logger();

/// Buffer pool, state cache, batching and frame statistics
std::shared_ptr<spdlog::logger> render_logger();

/// Graphics device backends
std::shared_ptr<spdlog::logger> gpu_logger();

// =============================================================================
// Log Level Management
// =============================================================================

/// Set global log level
void set_global_log_level(spdlog::level::level_enum level);

/// Set log level for specific logger
void set_logger_level(const std::string& name, spdlog::level::level_enum level);

/// Get current global log level
spdlog::level::level_enum get_global_log_level();

/// Parse log level from string
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

/// Get log level name
const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Lifecycle
// =============================================================================

/// Flush all loggers
void flush_all_loggers();

/// Shutdown logging system
void shutdown_logging();

} // namespace lumen_core
