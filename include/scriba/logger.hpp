/*
 * scriba - Transcription Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace scriba {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

// Process-wide leveled logger. Lines look like
//   [2025-01-01 12:00:00.123] [INFO ] [Driver-2] [job 1736_42_7] message
// The job field appears only inside a JobLogScope.
class Logger {
public:
    using Sink = std::function<void(const std::string& line)>;

    static void setLevel(LogLevel level) noexcept;
    // Reads SCRIBA_LOG_LEVEL; unset or unknown means INFO.
    static void initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static bool enabled(LogLevel level) noexcept;

    // Replaces the stderr writer; an empty sink restores it.
    static void setSink(Sink sink);

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    [[nodiscard]] static LogLevel parseLevel(const std::string& text, LogLevel fallback) noexcept;
    [[nodiscard]] static const char* levelName(LogLevel level) noexcept;

    [[nodiscard]] static std::string format(LogLevel level,
                                            std::chrono::system_clock::time_point when,
                                            const std::string& thread,
                                            const std::string& job,
                                            const std::string& message);
};

// Tags every line logged on this thread with a job id until destroyed.
// Scopes nest; the previous id comes back on exit.
class JobLogScope {
public:
    explicit JobLogScope(std::string jobId);
    ~JobLogScope();

    JobLogScope(const JobLogScope&) = delete;
    JobLogScope& operator=(const JobLogScope&) = delete;

private:
    std::string previous_;
};

// Thread naming for log context (Driver-N, Sweeper, IdleTimer, ...)
void setThreadName(const std::string& name);
[[nodiscard]] std::string currentThreadName();
[[nodiscard]] std::string driverThreadName(int driverId);

}

// Convenience macros for common usage
#define LOG_ERROR(msg) ::scriba::Logger::error(msg)
#define LOG_WARN(msg)  ::scriba::Logger::warn(msg)
#define LOG_INFO(msg)  ::scriba::Logger::info(msg)
#define LOG_DEBUG(msg) ::scriba::Logger::debug(msg)
#define LOG_TRACE(msg) ::scriba::Logger::trace(msg)
