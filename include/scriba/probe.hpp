/*
 * scriba - Transcription Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace scriba {

class DurationProbe {
public:
    virtual ~DurationProbe() = default;

    // Total audio duration in seconds, or nullopt when it cannot be determined.
    [[nodiscard]] virtual std::optional<double> probe(const std::filesystem::path& audioPath) noexcept = 0;
};

class FfprobeDurationProbe final : public DurationProbe {
public:
    explicit FfprobeDurationProbe(std::string binary = "ffprobe",
                                  std::chrono::milliseconds timeout = std::chrono::seconds(60));

    std::optional<double> probe(const std::filesystem::path& audioPath) noexcept override;

private:
    std::string binary_;
    std::chrono::milliseconds timeout_;
};

}
