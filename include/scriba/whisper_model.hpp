/*
 * scriba - Transcription Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "scriba/model.hpp"

struct whisper_context;

namespace scriba {

struct WhisperOptions {
    std::filesystem::path modelsDir = "models";
    bool useGpu = false;
    int gpuDevice = 0;
    int threads = 4;
    std::string language = "en";
};

// Routes ggml/whisper logging through a filter (WHISPER_LOG_LEVEL, default error).
void installWhisperLogFilter();

// 16 kHz WAV (PCM16, PCM32 or float32; channels are averaged).
[[nodiscard]] bool readWav16k(const std::filesystem::path& path, std::vector<float>& out, std::string& error);

class WhisperModel final : public ModelInstance {
public:
    // Throws std::runtime_error when whisper.cpp cannot load the file.
    WhisperModel(std::string name, const std::filesystem::path& modelPath, const WhisperOptions& options);
    ~WhisperModel() override;

    WhisperModel(const WhisperModel&) = delete;
    WhisperModel& operator=(const WhisperModel&) = delete;
    WhisperModel(WhisperModel&&) = delete;
    WhisperModel& operator=(WhisperModel&&) = delete;

    [[nodiscard]] const std::string& name() const noexcept override { return name_; }
    [[nodiscard]] std::string device() const override;
    [[nodiscard]] std::uint64_t memoryBytes() const noexcept override { return memoryBytes_; }

    // Each call runs on its own whisper_state, so leases may overlap.
    [[nodiscard]] InferenceResult transcribe(const std::filesystem::path& audioPath,
                                             const InferenceHooks& hooks) override;

private:
    std::string name_;
    WhisperOptions options_;
    whisper_context* ctx_ = nullptr;
    std::uint64_t memoryBytes_ = 0;
};

class WhisperModelLoader final : public ModelLoader {
public:
    explicit WhisperModelLoader(WhisperOptions options);

    [[nodiscard]] std::unique_ptr<ModelInstance> load(const std::string& modelName) override;
    [[nodiscard]] std::string device() const override;

private:
    WhisperOptions options_;
};

}
