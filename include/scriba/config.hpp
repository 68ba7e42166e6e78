/*
 * scriba - Transcription Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace scriba {

enum class ExecutionMode : uint8_t {
    InProcess,
    Process
};

struct ServiceConfig {
    std::filesystem::path modelsDir = "models";
    std::filesystem::path tempDir = "scriba-tmp";
    std::string defaultModel = "tiny";

    std::chrono::seconds modelIdleTimeout{300};
    int maxConcurrency = 1;
    std::chrono::seconds jobRetention{3600};
    std::chrono::seconds sweepInterval{300};
    int driverThreads = 4;

    // Empty disables the sibling notification.
    std::string siblingUrl = "http://ollama:11434";

    ExecutionMode execution = ExecutionMode::InProcess;
    std::string workerBinary = "scriba-worker";
    std::string ffprobeBinary = "ffprobe";
    std::chrono::seconds terminationGrace{5};
    std::chrono::milliseconds progressInterval{500};

    int gpuLayers = 0;
    int threads = 4;
    std::string language = "en";

    std::string host = "0.0.0.0";
    int port = 8001;

    // Reads SCRIBA_* variables; malformed values keep the defaults above.
    [[nodiscard]] static ServiceConfig fromEnv();

    [[nodiscard]] std::filesystem::path inputDir() const { return tempDir / "inputs"; }
    [[nodiscard]] std::filesystem::path outputDir() const { return tempDir / "outputs"; }
};

[[nodiscard]] const char* toString(ExecutionMode mode) noexcept;

}
