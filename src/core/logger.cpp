#include "kickqr/core/logger.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <cstdio>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace kickqr {

namespace {

// Convert our level to spdlog level
spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
        case LogLevel::OFF: return spdlog::level::off;
        default: return spdlog::level::info;
    }
}

// Global state
std::once_flag init_flag;
std::mutex logger_mutex;
std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers;
std::vector<spdlog::sink_ptr> sinks;

// Run sinks are unregistered, so spdlog::set_level never sees them
std::vector<std::weak_ptr<spdlog::logger>> run_loggers;
spdlog::level::level_enum run_level = spdlog::level::trace;

// Sinks for loggers created before init() (tests, early failures)
std::vector<spdlog::sink_ptr> active_sinks() {
    if (!sinks.empty()) {
        return sinks;
    }
    return spdlog::default_logger()->sinks();
}

}  // namespace

bool Logger::init(const std::string& log_file,
                  LogLevel console_level,
                  LogLevel file_level) {
    bool ok = true;

    std::call_once(init_flag, [&]() {
        try {
            // Console sink with colors
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(to_spdlog_level(console_level));
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
            sinks.push_back(console_sink);

            // File sink (rotating, 10MB max, 3 files)
            if (!log_file.empty()) {
                auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    log_file, 10 * 1024 * 1024, 3);
                file_sink->set_level(to_spdlog_level(file_level));
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
                sinks.push_back(file_sink);
            }

            auto default_logger = std::make_shared<spdlog::logger>(
                "kickqr", sinks.begin(), sinks.end());

            default_logger->set_level(spdlog::level::trace);  // Actual filtering per sink
            spdlog::drop("kickqr");
            spdlog::register_logger(default_logger);
            spdlog::set_default_logger(default_logger);

            std::lock_guard<std::mutex> lock(logger_mutex);
            loggers["kickqr"] = default_logger;

        } catch (const spdlog::spdlog_ex& e) {
            // Fallback to stderr
            std::fprintf(stderr, "Logger initialization failed: %s\n", e.what());
            ok = false;
        }
    });

    return ok;
}

void Logger::shutdown() {
    flush();
    spdlog::shutdown();
}

void Logger::set_level(LogLevel level) {
    const auto spd_level = to_spdlog_level(level);
    spdlog::set_level(spd_level);

    std::lock_guard<std::mutex> lock(logger_mutex);
    run_level = spd_level;
    auto it = run_loggers.begin();
    while (it != run_loggers.end()) {
        if (auto logger = it->lock()) {
            logger->set_level(spd_level);
            ++it;
        } else {
            it = run_loggers.erase(it);
        }
    }
}

void Logger::flush() {
    spdlog::default_logger()->flush();

    std::lock_guard<std::mutex> lock(logger_mutex);
    for (auto& [name, logger] : loggers) {
        logger->flush();
    }
}

std::shared_ptr<spdlog::logger> Logger::get(const std::string& module) {
    std::lock_guard<std::mutex> lock(logger_mutex);

    auto it = loggers.find(module);
    if (it != loggers.end()) {
        return it->second;
    }

    try {
        auto module_sinks = active_sinks();
        auto logger = std::make_shared<spdlog::logger>(
            module, module_sinks.begin(), module_sinks.end());

        logger->set_level(spdlog::level::trace);
        spdlog::register_logger(logger);
        loggers[module] = logger;

        return logger;

    } catch (const spdlog::spdlog_ex&) {
        // Return default logger on failure
        return spdlog::default_logger();
    }
}

std::shared_ptr<spdlog::logger> Logger::get() {
    return spdlog::default_logger();
}

DiagnosticSink Logger::create_run_sink(const std::string& run_name) {
    std::lock_guard<std::mutex> lock(logger_mutex);

    auto run_sinks = active_sinks();
    auto logger = std::make_shared<spdlog::logger>(
        run_name, run_sinks.begin(), run_sinks.end());
    logger->set_level(run_level);
    logger->flush_on(spdlog::level::warn);
    run_loggers.push_back(logger);
    return logger;
}

}  // namespace kickqr
