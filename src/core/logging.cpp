/**
 * @file logging.cpp
 * @brief Logger implementation
 */

#include "isoworker/core/logging.hpp"

#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

namespace isoworker {

namespace {

std::mutex g_log_mutex;
LogLevel g_level = LogLevel::Info;
bool g_level_initialized = false;
thread_local std::string t_thread_name;

} // namespace

void Logger::set_level(LogLevel level) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = level;
    g_level_initialized = true;
}

LogLevel Logger::level() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!g_level_initialized) {
        g_level = parse_env_level();
        g_level_initialized = true;
    }
    return g_level;
}

bool Logger::enabled(LogLevel level) noexcept {
    return static_cast<std::uint8_t>(level) <= static_cast<std::uint8_t>(Logger::level());
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    try {
        if (!enabled(level)) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local{};
        localtime_r(&time, &local);

        std::lock_guard<std::mutex> lock(g_log_mutex);

        std::ostringstream line;
        line << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
             << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
        line << " [" << level_to_string(level) << "]";

        if (!t_thread_name.empty()) {
            line << " [" << t_thread_name << "]";
        } else {
            line << " [T" << std::this_thread::get_id() << "]";
        }
        line << " " << message;

        std::cerr << line.str() << std::endl;
    } catch (...) {
        // A failing log line is dropped; logging must not throw into callers
    }
}

LogLevel Logger::parse_env_level() noexcept {
    const char* env_val = std::getenv("ISOWORKER_LOG_LEVEL");
    if (!env_val) {
        return LogLevel::Info;
    }

    std::string level_str(env_val);
    for (char& c : level_str) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (level_str == "error") return LogLevel::Error;
    if (level_str == "warn" || level_str == "warning") return LogLevel::Warn;
    if (level_str == "info") return LogLevel::Info;
    if (level_str == "debug") return LogLevel::Debug;
    if (level_str == "trace") return LogLevel::Trace;

    return LogLevel::Info;
}

const char* Logger::level_to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Info:  return "INFO ";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Trace: return "TRACE";
    }
    return "UNKN ";
}

void set_thread_name(const std::string& name) {
    t_thread_name = name;
}

const std::string& thread_name() noexcept {
    return t_thread_name;
}

} // namespace isoworker
