/*
 * scriba - Transcription Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/probe.hpp"
#include "scriba/subprocess.hpp"
#include "scriba/logger.hpp"
#include <cmath>

namespace scriba {

FfprobeDurationProbe::FfprobeDurationProbe(std::string binary, std::chrono::milliseconds timeout)
    : binary_(std::move(binary)), timeout_(timeout) {
}

std::optional<double> FfprobeDurationProbe::probe(const std::filesystem::path& audioPath) noexcept {
    try {
        CaptureResult result = runCapture({
            binary_, "-v", "error",
            "-show_entries", "format=duration",
            "-of", "default=noprint_wrappers=1:nokey=1",
            audioPath.string()
        }, timeout_);

        if (!result) {
            LOG_ERROR("ffprobe error for " + audioPath.string() + ": " + result.error +
                      (result.err.empty() ? "" : " - " + result.err));
            return std::nullopt;
        }

        std::size_t consumed = 0;
        double seconds = std::stod(result.out, &consumed);
        if (!std::isfinite(seconds) || seconds <= 0.0) {
            LOG_ERROR("ffprobe reported no usable duration for " + audioPath.string());
            return std::nullopt;
        }
        return seconds;
    } catch (const std::exception& e) {
        LOG_ERROR("ffprobe output not a duration for " + audioPath.string() + ": " + e.what());
        return std::nullopt;
    }
}

}
