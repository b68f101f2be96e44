/// @file log.cpp
/// @brief Logging system implementation for coframe_core
///
/// Extends the spdlog-based logging with:
/// - Named loggers for the pipeline subsystems
/// - Optional log file shared by all loggers
/// - Stage tracing scopes

#include <coframe/core/log.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <map>
#include <memory>
#include <vector>

namespace coframe_core {

// =============================================================================
// Logger Registry
// =============================================================================

namespace {

struct LoggerRegistry {
    std::mutex mutex;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
    spdlog::level::level_enum global_level = spdlog::level::info;
    bool console_enabled = true;
    std::string log_file;
    spdlog::sink_ptr console_sink;
    spdlog::sink_ptr file_sink;
};

LoggerRegistry& get_registry() {
    static LoggerRegistry registry;
    return registry;
}

/// Create sinks based on current configuration (registry mutex held)
std::vector<spdlog::sink_ptr> create_sinks(LoggerRegistry& reg) {
    std::vector<spdlog::sink_ptr> sinks;

    if (reg.console_enabled) {
        if (!reg.console_sink) {
            reg.console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            reg.console_sink->set_pattern("%n|%^%l%$|%v");
        }
        sinks.push_back(reg.console_sink);
    }

    if (!reg.log_file.empty()) {
        if (!reg.file_sink) {
            try {
                reg.file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(reg.log_file, true);
                reg.file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %n|%l|%v");
            } catch (const spdlog::spdlog_ex& e) {
                // Continue with console only
                spdlog::warn("Cannot open log file {}: {}", reg.log_file, e.what());
            }
        }
        if (reg.file_sink) {
            sinks.push_back(reg.file_sink);
        }
    }

    return sinks;
}

} // anonymous namespace

// =============================================================================
// Logger Configuration
// =============================================================================

void configure_logging(const LogConfig& config) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    if (reg.log_file != config.log_file) {
        reg.file_sink.reset();
    }
    reg.console_enabled = config.console_enabled;
    reg.log_file = config.log_file;
    reg.global_level = config.level;

    auto sinks = create_sinks(reg);
    for (auto& [name, logger] : reg.loggers) {
        logger->sinks() = sinks;
        logger->set_level(reg.global_level);
    }

    spdlog::set_level(reg.global_level);
}

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    auto it = reg.loggers.find(name);
    if (it != reg.loggers.end()) {
        return it->second;
    }

    auto sinks = create_sinks(reg);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(reg.global_level);

    reg.loggers[name] = logger;
    if (!spdlog::get(name)) {
        spdlog::register_logger(logger);
    }

    return logger;
}

std::shared_ptr<spdlog::logger> plugin_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("plugins");
    return logger;
}

std::shared_ptr<spdlog::logger> merge_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("merge");
    return logger;
}

std::shared_ptr<spdlog::logger> schema_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("schema");
    return logger;
}

std::shared_ptr<spdlog::logger> codegen_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("codegen");
    return logger;
}

// =============================================================================
// Log Level Management
// =============================================================================

spdlog::level::level_enum get_global_log_level() {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.global_level;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    if (str == "trace") return spdlog::level::trace;
    if (str == "debug") return spdlog::level::debug;
    if (str == "info") return spdlog::level::info;
    if (str == "warn" || str == "warning") return spdlog::level::warn;
    if (str == "error" || str == "err") return spdlog::level::err;
    if (str == "critical" || str == "fatal") return spdlog::level::critical;
    if (str == "off") return spdlog::level::off;
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

// =============================================================================
// Log Scoping
// =============================================================================

LogScope::LogScope(const std::string& name, const std::string& logger_name)
    : m_name(name)
    , m_logger(get_logger(logger_name))
    , m_start(std::chrono::steady_clock::now())
{
    m_logger->trace(">>> Entering {}", m_name);
}

LogScope::~LogScope() {
    auto end = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - m_start);
    m_logger->trace("<<< Exiting {} ({}us)", m_name, duration.count());
}

// =============================================================================
// Logging Shutdown
// =============================================================================

void flush_all_loggers() {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& [name, logger] : reg.loggers) {
        logger->flush();
    }
    spdlog::default_logger()->flush();
}

void shutdown_logging() {
    flush_all_loggers();

    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& [name, logger] : reg.loggers) {
        spdlog::drop(name);
    }
    reg.loggers.clear();
    reg.file_sink.reset();
}

} // namespace coframe_core
