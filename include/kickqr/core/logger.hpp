#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace kickqr {

/**
 * @brief Log severity levels
 */
enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5,
    OFF = 6
};

/**
 * @brief Diagnostic sink handed to every pipeline stage
 */
using DiagnosticSink = std::shared_ptr<spdlog::logger>;

/**
 * @brief Logger class wrapping spdlog
 *
 * Provides:
 * - Multiple sinks (colored console, rotating file)
 * - Module-tagged loggers for the LOG_* macros
 * - Run-scoped diagnostic sinks for the generation pipeline
 */
class Logger {
public:
    /**
     * @brief Initialize the logging system
     *
     * @param log_file Path to log file (optional)
     * @param console_level Minimum level for console output
     * @param file_level Minimum level for file output
     * @return true if initialization successful
     */
    static bool init(const std::string& log_file = "",
                     LogLevel console_level = LogLevel::INFO,
                     LogLevel file_level = LogLevel::DEBUG);

    /**
     * @brief Shutdown the logging system
     *
     * Flushes all pending messages.
     */
    static void shutdown();

    /**
     * @brief Set global log level
     *
     * Applies to registered module loggers, to live run sinks and to
     * run sinks created afterwards.
     */
    static void set_level(LogLevel level);

    /**
     * @brief Flush all pending log messages
     */
    static void flush();

    /**
     * @brief Get or create a logger for a module
     *
     * @param module Module name
     * @return Shared pointer to logger
     */
    static std::shared_ptr<spdlog::logger> get(const std::string& module);

    /**
     * @brief Get the default logger
     */
    static std::shared_ptr<spdlog::logger> get();

    /**
     * @brief Create an unregistered logger over the configured sinks
     *
     * The returned sink lives as long as its owner holds it, which for
     * the generator is one pipeline run.
     *
     * @param run_name Name shown in the [%n] field
     */
    static DiagnosticSink create_run_sink(const std::string& run_name);
};

// ============================================================================
// Logging Macros
// ============================================================================

#define KICKQR_LOG_TRACE(module, ...) \
    if (auto _log = ::kickqr::Logger::get(module)) _log->trace(__VA_ARGS__)

#define KICKQR_LOG_DEBUG(module, ...) \
    if (auto _log = ::kickqr::Logger::get(module)) _log->debug(__VA_ARGS__)

#define KICKQR_LOG_INFO(module, ...) \
    if (auto _log = ::kickqr::Logger::get(module)) _log->info(__VA_ARGS__)

#define KICKQR_LOG_WARN(module, ...) \
    if (auto _log = ::kickqr::Logger::get(module)) _log->warn(__VA_ARGS__)

#define KICKQR_LOG_ERROR(module, ...) \
    if (auto _log = ::kickqr::Logger::get(module)) _log->error(__VA_ARGS__)

#define KICKQR_LOG_CRITICAL(module, ...) \
    if (auto _log = ::kickqr::Logger::get(module)) _log->critical(__VA_ARGS__)

// Shorthand with default module
#define LOG_TRACE(...) KICKQR_LOG_TRACE("kickqr", __VA_ARGS__)
#define LOG_DEBUG(...) KICKQR_LOG_DEBUG("kickqr", __VA_ARGS__)
#define LOG_INFO(...)  KICKQR_LOG_INFO("kickqr", __VA_ARGS__)
#define LOG_WARN(...)  KICKQR_LOG_WARN("kickqr", __VA_ARGS__)
#define LOG_ERROR(...) KICKQR_LOG_ERROR("kickqr", __VA_ARGS__)
#define LOG_CRITICAL(...) KICKQR_LOG_CRITICAL("kickqr", __VA_ARGS__)

}  // namespace kickqr
