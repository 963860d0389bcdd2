#pragma once

/**
 * @file logging.hpp
 * @brief Levelled stderr logging with per-thread names
 */

#include <cstdint>
#include <string>

namespace isoworker {

enum class LogLevel : std::uint8_t {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3,
    Trace = 4
};

/**
 * @brief Process-wide logger
 *
 * The threshold comes from the ISOWORKER_LOG_LEVEL environment variable
 * (error, warn, info, debug, trace) unless set explicitly. Logging never
 * throws.
 */
class Logger {
public:
    static void set_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static bool enabled(LogLevel level) noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::Error, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::Warn, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::Info, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::Debug, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::Trace, msg); }

private:
    static LogLevel parse_env_level() noexcept;
    static const char* level_to_string(LogLevel level) noexcept;
};

/**
 * @brief Name the calling thread in subsequent log lines
 *
 * The name lives as long as the thread; a new thread starts unnamed.
 */
void set_thread_name(const std::string& name);

/**
 * @brief Name of the calling thread, empty if never set
 */
[[nodiscard]] const std::string& thread_name() noexcept;

} // namespace isoworker

// Message expressions are only evaluated when the level is enabled
#define ISOWORKER_LOG(level, msg)                                   \
    do {                                                            \
        if (::isoworker::Logger::enabled(level)) {                  \
            ::isoworker::Logger::log(level, msg);                   \
        }                                                           \
    } while (0)

#define ISOWORKER_LOG_ERROR(msg) ISOWORKER_LOG(::isoworker::LogLevel::Error, msg)
#define ISOWORKER_LOG_WARN(msg)  ISOWORKER_LOG(::isoworker::LogLevel::Warn, msg)
#define ISOWORKER_LOG_INFO(msg)  ISOWORKER_LOG(::isoworker::LogLevel::Info, msg)
#define ISOWORKER_LOG_DEBUG(msg) ISOWORKER_LOG(::isoworker::LogLevel::Debug, msg)
#define ISOWORKER_LOG_TRACE(msg) ISOWORKER_LOG(::isoworker::LogLevel::Trace, msg)
