/*
 * scriba - Transcription worker (scriba-worker)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/config.hpp"
#include "scriba/decoder.hpp"
#include "scriba/logger.hpp"
#include "scriba/probe.hpp"
#include "scriba/transcript.hpp"
#include "scriba/whisper_model.hpp"
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

using namespace scriba;
using json = nlohmann::json;

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_cancel_signal = 0;

void signalHandler(int signal) {
    g_cancel_signal = signal;
}

// One status line on stdout, flushed so the parent sees it immediately.
void emit(const json& line) {
    std::cout << line.dump(-1, ' ', false, json::error_handler_t::replace) << std::endl;
}

int fail(const std::string& code, const std::string& message) {
    std::cerr << json{{"status", "error"}, {"code", code}, {"message", message}}.dump(-1, ' ', false, json::error_handler_t::replace)
              << std::endl;
    return 1;
}

int main(int argc, char* argv[]) {
    // stderr is part of the protocol; keep it quiet unless asked.
    if (std::getenv("SCRIBA_LOG_LEVEL")) {
        Logger::initFromEnv();
    } else {
        Logger::setLevel(LogLevel::ERROR);
    }
    setThreadName("Worker");

    if (argc != 4) {
        return fail("invalid_arguments", "usage: scriba-worker <input_audio_file> <output_file> <model_name>");
    }

    const std::filesystem::path audioPath = argv[1];
    const std::filesystem::path outputPath = argv[2];
    const std::string modelName = argv[3];

    std::error_code ec;
    if (!std::filesystem::is_regular_file(audioPath, ec)) {
        return fail("file_not_found", "Input audio file '" + audioPath.string() + "' not found.");
    }

    std::signal(SIGTERM, signalHandler);
    std::signal(SIGINT, signalHandler);

    const ServiceConfig config = ServiceConfig::fromEnv();

    FfprobeDurationProbe probe(config.ffprobeBinary);
    auto duration = probe.probe(audioPath);
    if (!duration) {
        return fail("duration_probe_failed", "Could not determine audio duration.");
    }
    char durationText[32];
    std::snprintf(durationText, sizeof(durationText), "%.2f", *duration);
    emit({{"status", "info"}, {"code", "audio_duration"}, {"message", durationText}});

    WhisperOptions options;
    options.modelsDir = config.modelsDir;
    options.useGpu = config.gpuLayers > 0;
    options.threads = config.threads;
    options.language = config.language;

    std::unique_ptr<ModelInstance> model;
    try {
        WhisperModelLoader loader(options);
        emit({{"status", "info"}, {"code", "device"}, {"message", loader.device()}});

        emit({{"status", "loading"}, {"message", "Loading model: " + modelName}});
        model = loader.load(modelName);
        emit({{"status", "loading_complete"}, {"message", "Model loaded"}});
    } catch (const std::exception& e) {
        return fail("model_load_failed", e.what());
    }

    try {

        if (g_cancel_signal) {
            emit({{"status", "canceled"}, {"message", "Received signal " + std::to_string(g_cancel_signal) + " before transcription"}});
            return 0;
        }

        emit({{"status", "started"}, {"message", "Transcription started"}});

        InferenceHooks hooks;
        hooks.shouldAbort = [] { return g_cancel_signal != 0; };
        hooks.onProgress = [](double percent) { emit({{"status", "progress"}, {"progress", percent}}); };
        hooks.onSegment = [](const Segment& segment) {
            std::cout << "[" << formatTimestamp(segment.start) << " --> " << formatTimestamp(segment.end) << "]"
                      << segment.text << std::endl;
        };

        auto inference = model->transcribe(audioPath, hooks);

        if (inference.aborted || g_cancel_signal) {
            emit({{"status", "canceled"}, {"message", "Received signal " + std::to_string(g_cancel_signal) + ", transcription stopped"}});
            return 0;
        }
        if (!inference) {
            return fail("runtime_error", "Runtime error during transcription: " + inference.error);
        }

        if (!writeResultArtifact(outputPath, inference.result)) {
            return fail("output_write_failed", "Could not write result to " + outputPath.string());
        }

        emit({
            {"status", "completed"},
            {"message", "Transcription completed. Saved to: " + outputPath.string()},
            {"result_summary", {
                {"language", inference.result.language},
                {"segment_count", inference.result.segments.size()},
                {"text_length", inference.result.text.size()},
            }},
        });
        return 0;

    } catch (const std::exception& e) {
        return fail("runtime_error", "Runtime error during transcription: " + std::string(e.what()));
    }
}
