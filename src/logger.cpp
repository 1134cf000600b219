/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "castline/logger.hpp"
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

namespace castline {

namespace {
// Sentinel: level not read from the environment yet
constexpr std::uint8_t kUnset = 0xFF;

std::atomic<std::uint8_t> g_level{kUnset};
std::mutex g_write_mutex;

thread_local std::string t_thread_name;
thread_local std::string t_job;
}

void Logger::setLevel(LogLevel level) noexcept {
    g_level.store(static_cast<std::uint8_t>(level));
}

void Logger::initFromEnv() noexcept {
    g_level.store(static_cast<std::uint8_t>(parseEnvLevel()));
}

LogLevel Logger::level() noexcept {
    std::uint8_t current = g_level.load();
    if (current == kUnset) {
        std::uint8_t fromEnv = static_cast<std::uint8_t>(parseEnvLevel());
        // A concurrent setLevel wins over the lazy default.
        if (g_level.compare_exchange_strong(current, fromEnv)) {
            current = fromEnv;
        }
    }
    return static_cast<LogLevel>(current);
}

bool Logger::enabled(LogLevel level) noexcept {
    return static_cast<std::uint8_t>(level) <= static_cast<std::uint8_t>(Logger::level());
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    try {
        if (!enabled(level)) {
            return;
        }
        const std::string line = formatLine(std::chrono::system_clock::now(), level,
                                            currentThreadName(), t_job, message);
        // stdout belongs to the CLI transcript output
        std::lock_guard<std::mutex> lock(g_write_mutex);
        std::cerr << line << '\n';
    } catch (...) {
        // Never throw from logging
    }
}

std::string Logger::formatLine(std::chrono::system_clock::time_point when, LogLevel level,
                               const std::string& thread, const std::string& job,
                               const std::string& message) {
    const auto time = std::chrono::system_clock::to_time_t(when);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()) % 1000;
    std::tm tm_buf{};
    localtime_r(&time, &tm_buf);

    std::ostringstream ss;
    ss << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
    ss << " [" << levelToString(level) << "]";
    ss << " [" << thread << "]";
    if (!job.empty()) {
        ss << " [job " << job << "]";
    }
    ss << " " << message;
    return ss.str();
}

LogLevel Logger::parseLevel(const std::string& value, LogLevel fallback) noexcept {
    auto is = [&value](const char* name) {
        std::size_t i = 0;
        for (; name[i] != '\0'; ++i) {
            if (i >= value.size() ||
                std::tolower(static_cast<unsigned char>(value[i])) != name[i]) {
                return false;
            }
        }
        return i == value.size();
    };

    if (is("error")) return LogLevel::ERROR;
    if (is("warn") || is("warning")) return LogLevel::WARN;
    if (is("info")) return LogLevel::INFO;
    if (is("debug")) return LogLevel::DEBUG;
    if (is("trace")) return LogLevel::TRACE;
    return fallback;
}

LogLevel Logger::parseEnvLevel() noexcept {
    const char* env_val = std::getenv("CASTLINE_LOG_LEVEL");
    if (!env_val) return LogLevel::INFO;
    return parseLevel(env_val, LogLevel::INFO);
}

const char* Logger::levelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
    }
    return "UNKN ";
}

void setThreadName(const std::string& name) {
    t_thread_name = name;
}

const std::string& currentThreadName() {
    if (t_thread_name.empty()) {
        std::ostringstream oss;
        oss << "T" << std::this_thread::get_id();
        t_thread_name = oss.str();
    }
    return t_thread_name;
}

JobLogScope::JobLogScope(const std::string& jobId) : previous_(t_job) {
    t_job = jobId;
}

JobLogScope::~JobLogScope() {
    t_job = std::move(previous_);
}

const std::string& JobLogScope::current() noexcept {
    return t_job;
}

}
