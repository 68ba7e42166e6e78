/*
 * scriba - Transcription Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/logger.hpp"
#include <atomic>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <system_error>
#include <thread>

namespace scriba {

namespace {

std::atomic<uint8_t> g_level{static_cast<uint8_t>(LogLevel::INFO)};
std::once_flag g_env_once;
std::mutex g_sink_mutex;
Logger::Sink g_sink;

thread_local std::string t_thread_name;
thread_local std::string t_job_id;

LogLevel envLevel() noexcept {
    const char* env_val = std::getenv("SCRIBA_LOG_LEVEL");
    if (!env_val) return LogLevel::INFO;
    return Logger::parseLevel(env_val, LogLevel::INFO);
}

// Lazily applies SCRIBA_LOG_LEVEL for processes that never call initFromEnv.
void ensureLevel() noexcept {
    try {
        std::call_once(g_env_once, [] { g_level.store(static_cast<uint8_t>(envLevel())); });
    } catch (const std::system_error&) {
        // level stays at its current value
    }
}

}

void Logger::setLevel(LogLevel level) noexcept {
    ensureLevel();
    g_level.store(static_cast<uint8_t>(level));
}

void Logger::initFromEnv() noexcept {
    ensureLevel();
    g_level.store(static_cast<uint8_t>(envLevel()));
}

LogLevel Logger::level() noexcept {
    ensureLevel();
    return static_cast<LogLevel>(g_level.load());
}

bool Logger::enabled(LogLevel level) noexcept {
    return static_cast<uint8_t>(level) <= static_cast<uint8_t>(Logger::level());
}

void Logger::setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = std::move(sink);
}

std::string Logger::format(LogLevel level, std::chrono::system_clock::time_point when,
                           const std::string& thread, const std::string& job,
                           const std::string& message) {
    auto time_t = std::chrono::system_clock::to_time_t(when);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time_t, &local);

    std::ostringstream ss;
    ss << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
    ss << " [" << levelName(level) << "]";
    ss << " [" << thread << "]";
    if (!job.empty()) {
        ss << " [job " << job << "]";
    }
    ss << " " << message;
    return ss.str();
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    if (!enabled(level)) {
        return;
    }

    try {
        std::string thread = t_thread_name;
        if (thread.empty()) {
            std::ostringstream oss;
            oss << "T" << std::this_thread::get_id();
            thread = oss.str();
        }

        const std::string line = format(level, std::chrono::system_clock::now(), thread, t_job_id, message);

        // stdout belongs to the status-line protocol in scriba-worker
        std::lock_guard<std::mutex> lock(g_sink_mutex);
        if (g_sink) {
            g_sink(line);
        } else {
            std::cerr << line << std::endl;
        }
    } catch (const std::exception& e) {
        std::fprintf(stderr, "logging failed: %s\n", e.what());
    }
}

LogLevel Logger::parseLevel(const std::string& text, LogLevel fallback) noexcept {
    std::string level_str(text);
    for (char& c : level_str) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (level_str == "error") return LogLevel::ERROR;
    if (level_str == "warn" || level_str == "warning") return LogLevel::WARN;
    if (level_str == "info") return LogLevel::INFO;
    if (level_str == "debug") return LogLevel::DEBUG;
    if (level_str == "trace") return LogLevel::TRACE;
    return fallback;
}

const char* Logger::levelName(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default: return "UNKN ";
    }
}

JobLogScope::JobLogScope(std::string jobId) : previous_(std::move(t_job_id)) {
    t_job_id = std::move(jobId);
}

JobLogScope::~JobLogScope() {
    t_job_id = std::move(previous_);
}

void setThreadName(const std::string& name) {
    t_thread_name = name;
}

std::string currentThreadName() {
    return t_thread_name;
}

std::string driverThreadName(int driverId) {
    return "Driver-" + std::to_string(driverId);
}

}
