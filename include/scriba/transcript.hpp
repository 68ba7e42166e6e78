/*
 * scriba - Transcription Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "scriba/types.hpp"

namespace scriba {

// ADL hooks so results and records convert with nlohmann::json directly.
void to_json(nlohmann::json& j, const Segment& segment);
void from_json(const nlohmann::json& j, Segment& segment);
void to_json(nlohmann::json& j, const TranscriptionResult& result);
void from_json(const nlohmann::json& j, TranscriptionResult& result);
void to_json(nlohmann::json& j, const JobRecord& record);

[[nodiscard]] double toEpochSeconds(TimePoint tp) noexcept;

struct ArtifactReadResult {
    bool ok = false;
    bool missing = false;
    TranscriptionResult result;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

// Result artifact written by scriba-worker: {"text", "segments", "language"}.
[[nodiscard]] ArtifactReadResult readResultArtifact(const std::filesystem::path& path) noexcept;

// Writes via a temp file and rename so readers never see a partial artifact.
[[nodiscard]] bool writeResultArtifact(const std::filesystem::path& path,
                                       const TranscriptionResult& result) noexcept;

}
