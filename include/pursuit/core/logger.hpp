#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace pursuit {

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
 * @brief Parse a level name ("trace", "debug", "info", "warn", "error",
 * "critical", "off"); unknown names map to INFO
 */
LogLevel log_level_from_string(const std::string& name);

/**
 * @brief Process-wide spdlog setup shared by the selector, controller,
 * pipeline and pursuit_sim
 *
 * Every component logs through a named async logger ("selector",
 * "controller", "pipeline", "pursuit") writing to a colored console sink and,
 * when logging.file is set, a rotating file sink.
 *
 * Until init() is called, get() hands out spdlog's default logger so the
 * tracking components can be used without a logging setup (unit tests).
 */
class Logger {
public:
    /**
     * @brief Install the sinks; later calls are no-ops
     *
     * @param log_file Rotating log file (5MB x 3), empty for console only
     * @param console_level Console threshold, usually from logging.level
     * @param file_level File threshold
     */
    static bool init(const std::string& log_file = "",
                     LogLevel console_level = LogLevel::INFO,
                     LogLevel file_level = LogLevel::DEBUG);

    /// Drain the async queue and drop every module logger
    static void shutdown();

    /// Apply one threshold to every module logger created so far
    static void set_level(LogLevel level);

    static void flush();

    /// Named logger for a tracking module, created on first use
    static std::shared_ptr<spdlog::logger> get(const std::string& module);

    static std::shared_ptr<spdlog::logger> get();
};

// ============================================================================
// Logging Macros
// ============================================================================

#define PURSUIT_LOG_TRACE(module, ...) \
    if (auto _log = ::pursuit::Logger::get(module)) _log->trace(__VA_ARGS__)

#define PURSUIT_LOG_DEBUG(module, ...) \
    if (auto _log = ::pursuit::Logger::get(module)) _log->debug(__VA_ARGS__)

#define PURSUIT_LOG_INFO(module, ...) \
    if (auto _log = ::pursuit::Logger::get(module)) _log->info(__VA_ARGS__)

#define PURSUIT_LOG_WARN(module, ...) \
    if (auto _log = ::pursuit::Logger::get(module)) _log->warn(__VA_ARGS__)

#define PURSUIT_LOG_ERROR(module, ...) \
    if (auto _log = ::pursuit::Logger::get(module)) _log->error(__VA_ARGS__)

#define PURSUIT_LOG_CRITICAL(module, ...) \
    if (auto _log = ::pursuit::Logger::get(module)) _log->critical(__VA_ARGS__)

// Shorthand with default module
#define LOG_TRACE(...) PURSUIT_LOG_TRACE("pursuit", __VA_ARGS__)
#define LOG_DEBUG(...) PURSUIT_LOG_DEBUG("pursuit", __VA_ARGS__)
#define LOG_INFO(...)  PURSUIT_LOG_INFO("pursuit", __VA_ARGS__)
#define LOG_WARN(...)  PURSUIT_LOG_WARN("pursuit", __VA_ARGS__)
#define LOG_ERROR(...) PURSUIT_LOG_ERROR("pursuit", __VA_ARGS__)
#define LOG_CRITICAL(...) PURSUIT_LOG_CRITICAL("pursuit", __VA_ARGS__)

}  // namespace pursuit
