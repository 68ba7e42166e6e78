/*
 * scriba - Transcription Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <string>

namespace scriba {

// Another accelerator consumer that should drop its model before we load.
class SiblingNotifier {
public:
    virtual ~SiblingNotifier() = default;

    // Best effort. Returns whether the sibling acknowledged; never throws.
    virtual bool releaseMemory() noexcept = 0;
};

// Asks an Ollama server to unload: POST /api/generate {"model":"","keep_alive":0}.
class OllamaNotifier final : public SiblingNotifier {
public:
    explicit OllamaNotifier(std::string baseUrl,
                            std::chrono::seconds timeout = std::chrono::seconds(10));

    bool releaseMemory() noexcept override;

    [[nodiscard]] const std::string& baseUrl() const noexcept { return baseUrl_; }

private:
    std::string baseUrl_;
    std::chrono::seconds timeout_;
};

}
