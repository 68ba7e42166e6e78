/*
 * scriba - Transcription Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "scriba/cancellation.hpp"
#include "scriba/config.hpp"
#include "scriba/gate.hpp"
#include "scriba/model.hpp"
#include "scriba/registry.hpp"
#include "scriba/types.hpp"

namespace scriba {

class DurationProbe;
class Executor;
class Pool;
class SiblingNotifier;

struct SubmitRequest {
    std::filesystem::path audioPath;
    std::string modelName;
    // Delete audioPath once the job is terminal.
    bool temporary = false;
};

struct SubmitResult {
    bool ok = false;
    JobId id;
    ErrorCode error = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Collaborators the orchestrator drives. The daemon wires the real ones,
// tests substitute fakes.
struct OrchestratorDeps {
    std::shared_ptr<ModelLoader> loader;
    std::shared_ptr<DurationProbe> probe;
    std::shared_ptr<SiblingNotifier> sibling;   // may be null
    std::shared_ptr<Executor> executor;
};

[[nodiscard]] bool isValidModelName(const std::string& name) noexcept;

// Accepts jobs, drives each through queued -> model_loading -> transcribing
// -> terminal on a pool thread, and answers status, cancel and model queries.
class JobOrchestrator final {
public:
    // Throws std::invalid_argument when a required dependency is missing.
    JobOrchestrator(ServiceConfig config, OrchestratorDeps deps);
    ~JobOrchestrator();

    JobOrchestrator(const JobOrchestrator&) = delete;
    JobOrchestrator& operator=(const JobOrchestrator&) = delete;
    JobOrchestrator(JobOrchestrator&&) = delete;
    JobOrchestrator& operator=(JobOrchestrator&&) = delete;

    [[nodiscard]] bool start();
    // Cancels live jobs, waits for their drivers, stops the sweeper and
    // unloads the model.
    void shutdown() noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    [[nodiscard]] SubmitResult submit(const SubmitRequest& request);
    [[nodiscard]] CancelOutcome cancel(const JobId& id);
    [[nodiscard]] std::optional<JobRecord> status(const JobId& id) const;
    [[nodiscard]] std::vector<JobRecord> list() const;

    bool unloadModel();
    [[nodiscard]] ModelStatus modelStatus() const;

    // One retention pass; the sweeper thread calls this periodically.
    std::size_t sweep();

    [[nodiscard]] const ServiceConfig& config() const noexcept { return config_; }
    [[nodiscard]] const ConcurrencyGate& gate() const noexcept { return gate_; }
    [[nodiscard]] std::size_t liveJobs() const;

private:
    struct JobContext {
        SubmitRequest request;
        CancelTokenPtr token;
        std::filesystem::path outputPath;
        std::atomic<bool> claimed{false};
        std::atomic<bool> finalized{false};
    };
    using ContextPtr = std::shared_ptr<JobContext>;

    struct Terminal {
        JobStatus status = JobStatus::Failed;
        std::optional<TranscriptionResult> result;
        ErrorCode error = ErrorCode::None;
        std::string message;
    };

    void drive(const JobId& id);
    void runJob(const JobId& id, JobContext& ctx);
    void finish(const JobId& id, JobContext& ctx, Terminal terminal) noexcept;
    [[nodiscard]] ContextPtr context(const JobId& id) const;
    void setPhase(const JobId& id, JobStatus status, const std::string& message);
    [[nodiscard]] bool prepareWorkspace() noexcept;
    void sweepLoop();

    ServiceConfig config_;
    OrchestratorDeps deps_;

    JobRegistry registry_;
    CancellationController cancellation_;
    ConcurrencyGate gate_;
    ModelResourceManager models_;
    std::unique_ptr<Pool> pool_;

    mutable std::mutex contextsMutex_;
    std::unordered_map<JobId, ContextPtr> contexts_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::thread sweeperThread_;
};

}
