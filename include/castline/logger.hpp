/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace castline {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    static void initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static bool enabled(LogLevel level) noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    [[nodiscard]] static LogLevel parseLevel(const std::string& value, LogLevel fallback) noexcept;

    // "[2025-01-01 12:00:00.042] [INFO ] [Pipeline-1] [job 1a2b] message"
    // The job tag is left out when job is empty.
    [[nodiscard]] static std::string formatLine(std::chrono::system_clock::time_point when, LogLevel level,
                                                const std::string& thread, const std::string& job,
                                                const std::string& message);

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Names the calling thread in its log lines. Unnamed threads log as T<id>.
void setThreadName(const std::string& name);
[[nodiscard]] const std::string& currentThreadName();

// Tags every line logged by this thread with a job id while in scope.
// Scopes nest; the outer job is restored on exit.
class JobLogScope final {
public:
    explicit JobLogScope(const std::string& jobId);
    ~JobLogScope();

    JobLogScope(const JobLogScope&) = delete;
    JobLogScope& operator=(const JobLogScope&) = delete;

    [[nodiscard]] static const std::string& current() noexcept;

private:
    std::string previous_;
};

}

#define LOG_ERROR(msg) ::castline::Logger::error(msg)
#define LOG_WARN(msg)  ::castline::Logger::warn(msg)
#define LOG_INFO(msg)  ::castline::Logger::info(msg)
#define LOG_DEBUG(msg) ::castline::Logger::debug(msg)
#define LOG_TRACE(msg) ::castline::Logger::trace(msg)
