#pragma once

/// @file log.hpp
/// @brief Logging utilities for coframe

#include <spdlog/spdlog.h>
#include <string>
#include <memory>
#include <optional>
#include <chrono>

namespace coframe_core {

// =============================================================================
// Log Configuration
// =============================================================================

/// Configuration for the logging system
struct LogConfig {
    bool console_enabled = true;
    std::string log_file;   ///< Empty disables the file sink
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Configure logging system (sinks and level); recreates existing loggers
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Plugin discovery and ordering
std::shared_ptr<spdlog::logger> plugin_logger();

/// Document merge
std::shared_ptr<spdlog::logger> merge_logger();

/// Type and table resolution
std::shared_ptr<spdlog::logger> schema_logger();

/// Source generation
std::shared_ptr<spdlog::logger> codegen_logger();

// =============================================================================
// Log Level Management
// =============================================================================

/// Get current global log level
spdlog::level::level_enum get_global_log_level();

/// Parse log level from string
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

/// Get log level name
const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Log Scoping (RAII)
// =============================================================================

/// RAII log scope for pipeline stage tracing
class LogScope {
public:
    LogScope(const std::string& name, const std::string& logger_name = "coframe");
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;
    LogScope(LogScope&&) = delete;
    LogScope& operator=(LogScope&&) = delete;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

#define COFRAME_LOG_CONCAT_IMPL(a, b) a##b
#define COFRAME_LOG_CONCAT(a, b) COFRAME_LOG_CONCAT_IMPL(a, b)
#define COFRAME_LOG_SCOPE(name, logger) \
    ::coframe_core::LogScope COFRAME_LOG_CONCAT(_log_scope_, __LINE__)(name, logger)

// =============================================================================
// Lifecycle
// =============================================================================

/// Flush all loggers
void flush_all_loggers();

/// Shutdown logging system
void shutdown_logging();

} // namespace coframe_core
