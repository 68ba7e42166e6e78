/*
 * scriba - Transcription Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "scriba/types.hpp"

namespace scriba {

class SiblingNotifier;

// "tiny" -> <modelsDir>/ggml-tiny.bin; an existing file path is used as is.
[[nodiscard]] std::filesystem::path resolveModelPath(const std::filesystem::path& modelsDir,
                                                     const std::string& modelName);

struct InferenceHooks {
    std::function<bool()> shouldAbort;
    // Percent reported by the engine itself.
    std::function<void(double)> onProgress;
    std::function<void(const Segment&)> onSegment;
};

struct InferenceResult {
    bool ok = false;
    bool aborted = false;
    TranscriptionResult result;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

// A loaded recognition model. Owned by the slot, reached through a lease.
class ModelInstance {
public:
    virtual ~ModelInstance() = default;

    [[nodiscard]] virtual const std::string& name() const noexcept = 0;
    [[nodiscard]] virtual std::string device() const = 0;
    [[nodiscard]] virtual std::uint64_t memoryBytes() const noexcept = 0;

    // Synchronous and potentially long; checks hooks.shouldAbort.
    [[nodiscard]] virtual InferenceResult transcribe(const std::filesystem::path& audioPath,
                                                     const InferenceHooks& hooks) = 0;
};

class ModelLoader {
public:
    virtual ~ModelLoader() = default;

    // Throws std::runtime_error when the model cannot be loaded.
    [[nodiscard]] virtual std::unique_ptr<ModelInstance> load(const std::string& modelName) = 0;
    [[nodiscard]] virtual std::string device() const = 0;
};

class ModelResourceManager;

// Move-only proof of acquisition. Releases on destruction if still held.
class ModelLease final {
public:
    ModelLease() noexcept = default;
    ~ModelLease() { release(); }

    ModelLease(const ModelLease&) = delete;
    ModelLease& operator=(const ModelLease&) = delete;
    ModelLease(ModelLease&& other) noexcept;
    ModelLease& operator=(ModelLease&& other) noexcept;

    void release() noexcept;

    [[nodiscard]] bool valid() const noexcept { return instance_ != nullptr; }
    explicit operator bool() const noexcept { return valid(); }
    [[nodiscard]] ModelInstance& model() const noexcept { return *instance_; }
    [[nodiscard]] const std::string& modelName() const noexcept { return instance_->name(); }

private:
    friend class ModelResourceManager;
    ModelLease(ModelResourceManager* manager, std::shared_ptr<ModelInstance> instance) noexcept
        : manager_(manager), instance_(std::move(instance)) {}

    ModelResourceManager* manager_ = nullptr;
    std::shared_ptr<ModelInstance> instance_;
};

struct AcquireResult {
    bool ok = false;
    ModelLease lease;
    ErrorCode error = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

struct ModelStatus {
    bool loaded = false;
    std::optional<std::string> modelName;
    std::string device;
    std::optional<double> memoryUsedMb;
    std::optional<TimePoint> lastUsedAt;
    double idleTimeoutSeconds = 0.0;
    int activeJobs = 0;
};

// The single model slot. acquire/release/evict are serialized on one mutex;
// an idle timer thread unloads the model once nobody has used it for the
// configured window.
class ModelResourceManager final {
public:
    ModelResourceManager(std::shared_ptr<ModelLoader> loader,
                         std::shared_ptr<SiblingNotifier> sibling,
                         std::chrono::milliseconds idleTimeout);
    ~ModelResourceManager();

    ModelResourceManager(const ModelResourceManager&) = delete;
    ModelResourceManager& operator=(const ModelResourceManager&) = delete;
    ModelResourceManager(ModelResourceManager&&) = delete;
    ModelResourceManager& operator=(ModelResourceManager&&) = delete;

    // Fails with ResourceBusy when a different model is in use, and with
    // ResourceLoadFailed when loading throws (the slot is left empty).
    [[nodiscard]] AcquireResult acquire(const std::string& modelName);
    void release(ModelLease& lease) noexcept { lease.release(); }

    // Evicts only when no job holds a lease.
    bool unload();

    [[nodiscard]] ModelStatus status() const;
    [[nodiscard]] int activeRefcount() const;
    [[nodiscard]] std::optional<std::string> loadedModel() const;
    [[nodiscard]] std::chrono::milliseconds idleTimeout() const noexcept { return idleTimeout_; }

private:
    friend class ModelLease;
    void releaseLease() noexcept;

    bool unloadLocked(const char* reason);
    void armIdleTimerLocked();
    void disarmIdleTimerLocked();
    void idleLoop();

    std::shared_ptr<ModelLoader> loader_;
    std::shared_ptr<SiblingNotifier> sibling_;
    const std::chrono::milliseconds idleTimeout_;

    mutable std::mutex mutex_;
    std::condition_variable timerCv_;

    // slot
    std::optional<std::string> modelName_;
    std::shared_ptr<ModelInstance> instance_;
    int activeRefcount_ = 0;
    std::chrono::steady_clock::time_point lastUsedAt_{};
    std::optional<TimePoint> lastUsedWall_;

    // idle timer
    std::optional<std::chrono::steady_clock::time_point> idleDeadline_;
    std::chrono::steady_clock::time_point armedLastUsed_{};
    uint64_t timerGeneration_ = 0;
    bool stopping_ = false;
    std::thread timerThread_;
};

}
