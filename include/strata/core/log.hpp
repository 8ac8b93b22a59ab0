#pragma once

/// @file log.hpp
/// @brief Logging utilities for strata

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>
#include <string>
#include <memory>
#include <optional>

// =============================================================================
// Logging Macros
// =============================================================================

#define STRATA_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define STRATA_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define STRATA_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define STRATA_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define STRATA_LOG_ERROR(...) spdlog::error(__VA_ARGS__)
#define STRATA_LOG_CRITICAL(...) spdlog::critical(__VA_ARGS__)

namespace strata_core {

// =============================================================================
// Basic Logging (Inline)
// =============================================================================

/// @brief Initialize the logging system (basic)
inline void init_logging() {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);
}

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

/// Configuration loading and directive processing
std::shared_ptr<spdlog::logger> config_logger();

/// Per-request layer resolution
std::shared_ptr<spdlog::logger> layer_logger();

/// Host request pipeline
std::shared_ptr<spdlog::logger> host_logger();

// =============================================================================
// Log Level Management
// =============================================================================

/// Parse log level from string
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

// =============================================================================
// Lifecycle
// =============================================================================

/// Flush all loggers
void flush_all_loggers();

/// Shutdown logging system
void shutdown_logging();

} // namespace strata_core
