/*
 * scriba - Transcription Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/transcript.hpp"
#include "scriba/logger.hpp"
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace scriba {

void to_json(nlohmann::json& j, const Segment& segment) {
    j = nlohmann::json{{"start", segment.start}, {"end", segment.end}, {"text", segment.text}};
}

void from_json(const nlohmann::json& j, Segment& segment) {
    segment.start = j.value("start", 0.0);
    segment.end = j.value("end", 0.0);
    segment.text = j.value("text", std::string());
}

void to_json(nlohmann::json& j, const TranscriptionResult& result) {
    j = nlohmann::json{{"text", result.text}, {"segments", result.segments}, {"language", result.language}};
}

void from_json(const nlohmann::json& j, TranscriptionResult& result) {
    if (!j.is_object()) {
        throw std::runtime_error("result artifact is not a JSON object");
    }
    result.text = j.value("text", std::string());
    result.language = j.value("language", std::string("en"));
    result.segments.clear();
    if (j.contains("segments") && j.at("segments").is_array()) {
        for (const auto& item : j.at("segments")) {
            result.segments.push_back(item.get<Segment>());
        }
    }
}

double toEpochSeconds(TimePoint tp) noexcept {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

namespace {
template <typename T>
nlohmann::json optionalJson(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json optionalTime(const std::optional<TimePoint>& value) {
    return value ? nlohmann::json(toEpochSeconds(*value)) : nlohmann::json(nullptr);
}
}

void to_json(nlohmann::json& j, const JobRecord& record) {
    j = nlohmann::json{
        {"job_id", record.id},
        {"status", toString(record.status)},
        {"progress", record.progress},
        {"duration", optionalJson(record.audioDuration)},
        {"result", optionalJson(record.result)},
        {"error", optionalJson(record.error)},
        {"error_code", record.errorCode == ErrorCode::None ? nlohmann::json(nullptr)
                                                            : nlohmann::json(toString(record.errorCode))},
        {"message", optionalJson(record.message)},
        {"model_name", record.modelName},
        {"device", optionalJson(record.device)},
        {"submitted_at", toEpochSeconds(record.submittedAt)},
        {"start_time", optionalTime(record.startedAt)},
        {"end_time", optionalTime(record.endedAt)},
    };
}

ArtifactReadResult readResultArtifact(const std::filesystem::path& path) noexcept {
    ArtifactReadResult out;
    try {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            out.missing = true;
            out.error = "Process completed but output file was not found.";
            return out;
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            out.error = "Failed to open result file: " + path.string();
            return out;
        }
        std::string content((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());

        auto parsed = nlohmann::json::parse(content, nullptr, false);
        if (parsed.is_discarded()) {
            out.error = "Failed to read result file: invalid JSON in " + path.string();
            return out;
        }
        out.result = parsed.get<TranscriptionResult>();
        out.ok = true;
        return out;
    } catch (const std::exception& e) {
        out.error = "Failed to read result file: " + std::string(e.what());
        return out;
    }
}

bool writeResultArtifact(const std::filesystem::path& path, const TranscriptionResult& result) noexcept {
    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        auto tempPath = path;
        tempPath += ".tmp";
        {
            std::ofstream file(tempPath, std::ios::binary);
            if (!file) return false;
            file << nlohmann::json(result).dump(2);
            file.flush();
            if (!file.good()) return false;
        }
        std::filesystem::rename(tempPath, path);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to write result artifact " + path.string() + ": " + e.what());
        return false;
    }
}

}
