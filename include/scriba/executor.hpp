/*
 * scriba - Transcription Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "scriba/decoder.hpp"
#include "scriba/model.hpp"
#include "scriba/types.hpp"

namespace scriba {

class CancelToken;

struct WorkRequest {
    JobId jobId;
    std::filesystem::path audioPath;
    std::string modelName;
    std::filesystem::path outputPath;
    double audioDuration = 0.0;
};

enum class ExecutionStatus : uint8_t {
    Succeeded,
    Failed,
    Canceled
};

struct ExecutionOutcome {
    ExecutionStatus status = ExecutionStatus::Failed;
    TranscriptionResult result;
    ErrorCode error = ErrorCode::None;
    std::string message;
};

using EventSink = std::function<void(const StatusEvent&)>;

// One unit of transcription work, run on the calling driver thread while
// the job holds a model lease. Must return promptly after the token fires.
class Executor {
public:
    virtual ~Executor() = default;

    [[nodiscard]] virtual ExecutionOutcome execute(const WorkRequest& request,
                                                   ModelLease& lease,
                                                   const CancelToken& token,
                                                   const EventSink& sink) = 0;
    [[nodiscard]] virtual const char* name() const noexcept = 0;
};

// Runs the leased model on this thread; progress and segments arrive as
// events, cancellation goes through the engine's abort hook.
class InProcessExecutor final : public Executor {
public:
    ExecutionOutcome execute(const WorkRequest& request, ModelLease& lease,
                             const CancelToken& token, const EventSink& sink) override;
    const char* name() const noexcept override { return "inprocess"; }
};

// Launches scriba-worker (or any program speaking the status-line protocol)
// as <worker> [extraArgs...] <audio> <output.json> <model>.
class ProcessExecutor final : public Executor {
public:
    struct Options {
        std::string workerBinary = "scriba-worker";
        std::vector<std::string> extraArgs;
        std::chrono::milliseconds grace = std::chrono::seconds(5);
        std::chrono::milliseconds pollInterval = std::chrono::milliseconds(100);
    };

    explicit ProcessExecutor(Options options);

    ExecutionOutcome execute(const WorkRequest& request, ModelLease& lease,
                             const CancelToken& token, const EventSink& sink) override;
    const char* name() const noexcept override { return "process"; }

    [[nodiscard]] const Options& options() const noexcept { return options_; }

private:
    Options options_;
};

// Stand-in for a model that lives inside the worker process. Occupies the
// slot so switching and idle eviction behave the same in both modes.
class WorkerModelReservation final : public ModelInstance {
public:
    WorkerModelReservation(std::string name, std::filesystem::path modelPath, std::uint64_t bytes);

    const std::string& name() const noexcept override { return name_; }
    std::string device() const override { return "worker"; }
    std::uint64_t memoryBytes() const noexcept override { return bytes_; }

    // Not runnable here; ProcessExecutor never calls it.
    InferenceResult transcribe(const std::filesystem::path& audioPath, const InferenceHooks& hooks) override;

    [[nodiscard]] const std::filesystem::path& modelPath() const noexcept { return modelPath_; }

private:
    std::string name_;
    std::filesystem::path modelPath_;
    std::uint64_t bytes_;
};

class WorkerModelLoader final : public ModelLoader {
public:
    explicit WorkerModelLoader(std::filesystem::path modelsDir);

    // Throws std::runtime_error when the model file does not exist.
    std::unique_ptr<ModelInstance> load(const std::string& modelName) override;
    std::string device() const override { return "worker"; }

private:
    std::filesystem::path modelsDir_;
};

}
