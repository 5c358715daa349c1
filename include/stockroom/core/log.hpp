#pragma once

/// @file log.hpp
/// @brief Logging utilities for stockroom

#include <spdlog/spdlog.h>
#include <string>
#include <memory>
#include <optional>

// =============================================================================
// Logging Macros
// =============================================================================

#define STOCK_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define STOCK_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define STOCK_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define STOCK_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define STOCK_LOG_ERROR(...) spdlog::error(__VA_ARGS__)
#define STOCK_LOG_CRITICAL(...) spdlog::critical(__VA_ARGS__)

namespace stock_core {

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
    std::size_t max_file_size = 5 * 1024 * 1024;  // 5 MB
    std::size_t max_files = 3;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Configure logging system with full options
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Get the rules engine logger ("puzzle")
std::shared_ptr<spdlog::logger> puzzle_logger();

/// Get the content/definition logger ("content")
std::shared_ptr<spdlog::logger> content_logger();

// =============================================================================
// Log Levels
// =============================================================================

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

} // namespace stock_core
