/*
 * scriba - Transcription Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/config.hpp"
#include "scriba/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <thread>

namespace scriba {

namespace {
// One year; keeps millisecond and steady_clock arithmetic far from overflow.
constexpr long kMaxSeconds = 365L * 24 * 3600;
constexpr long kMaxThreads = 1024;

long env_long(const char* name, long defv, long minValue, long maxValue) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        std::size_t consumed = 0;
        long parsed = std::stol(val, &consumed);
        if (consumed != std::string(val).size() || parsed < minValue || parsed > maxValue) {
            LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
            return defv;
        }
        return parsed;
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}

std::string env_str(const char* name, const std::string& defv) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : defv;
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}
}

ServiceConfig ServiceConfig::fromEnv() {
    ServiceConfig config;

    config.modelsDir = env_str("SCRIBA_MODELS_DIR", config.modelsDir.string());
    config.tempDir = env_str("SCRIBA_TEMP_DIR", config.tempDir.string());
    config.defaultModel = env_str("SCRIBA_DEFAULT_MODEL", config.defaultModel);

    config.modelIdleTimeout = std::chrono::seconds(env_long("SCRIBA_MODEL_IDLE_TIMEOUT", 300, 0, kMaxSeconds));
    config.maxConcurrency = static_cast<int>(env_long("SCRIBA_MAX_CONCURRENCY", 1, 1, kMaxThreads));
    config.jobRetention = std::chrono::seconds(env_long("SCRIBA_JOB_RETENTION", 3600, 0, kMaxSeconds));
    config.sweepInterval = std::chrono::seconds(env_long("SCRIBA_SWEEP_INTERVAL", 300, 1, kMaxSeconds));
    config.driverThreads = static_cast<int>(env_long("SCRIBA_DRIVER_THREADS", 4, 1, kMaxThreads));

    config.siblingUrl = env_str("SCRIBA_SIBLING_URL", config.siblingUrl);

    std::string mode = toLowerCopy(env_str("SCRIBA_EXECUTION", "inprocess"));
    if (mode == "process" || mode == "subprocess") {
        config.execution = ExecutionMode::Process;
    } else if (mode != "inprocess" && mode != "in-process") {
        LOG_WARN("Unknown SCRIBA_EXECUTION '" + mode + "', using inprocess");
    }
    config.workerBinary = env_str("SCRIBA_WORKER_BIN", config.workerBinary);
    config.ffprobeBinary = env_str("SCRIBA_FFPROBE", config.ffprobeBinary);
    config.terminationGrace = std::chrono::seconds(env_long("SCRIBA_TERMINATION_GRACE", 5, 0, kMaxSeconds));
    config.progressInterval = std::chrono::milliseconds(env_long("SCRIBA_PROGRESS_INTERVAL_MS", 500, 0, kMaxSeconds * 1000));

    config.gpuLayers = static_cast<int>(env_long("SCRIBA_GPU_LAYERS", 0, 0, 100000));
    int hw = static_cast<int>(std::thread::hardware_concurrency());
    config.threads = static_cast<int>(env_long("SCRIBA_THREADS", std::max(1, std::min(hw, 8)), 1, kMaxThreads));
    config.language = env_str("SCRIBA_LANGUAGE", config.language);

    config.host = env_str("SCRIBA_HOST", config.host);
    config.port = static_cast<int>(env_long("SCRIBA_PORT", 8001, 1, 65535));

    return config;
}

const char* toString(ExecutionMode mode) noexcept {
    switch (mode) {
        case ExecutionMode::InProcess: return "inprocess";
        case ExecutionMode::Process: return "process";
        default: return "unknown";
    }
}

}
