/*
 * scriba - Transcription Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <sys/types.h>

#include "scriba/types.hpp"

namespace scriba {

class JobRegistry;

class CancelToken final {
public:
    void cancel() noexcept { canceled_.store(true); }
    [[nodiscard]] bool isCanceled() const noexcept { return canceled_.load(); }

private:
    std::atomic<bool> canceled_{false};
};

using CancelTokenPtr = std::shared_ptr<CancelToken>;

enum class CancelOutcome : uint8_t {
    Accepted,
    AlreadyCanceling,
    AlreadyTerminal,
    NotFound
};

[[nodiscard]] const char* toString(CancelOutcome outcome) noexcept;

class CancellationController final {
public:
    explicit CancellationController(JobRegistry& registry) noexcept;

    CancellationController(const CancellationController&) = delete;
    CancellationController& operator=(const CancellationController&) = delete;

    // Creates the job's flag (false).
    CancelTokenPtr registerJob(const JobId& id);

    // Sets the flag and moves the record to canceling unless it is
    // already terminal.
    [[nodiscard]] CancelOutcome requestCancel(const JobId& id);

    [[nodiscard]] bool isCanceled(const JobId& id) const;
    [[nodiscard]] CancelTokenPtr token(const JobId& id) const;

    // Drops the flag once the job is terminal.
    void clear(const JobId& id);
    [[nodiscard]] std::size_t trackedJobs() const;

private:
    JobRegistry& registry_;
    mutable std::mutex mutex_;
    std::unordered_map<JobId, CancelTokenPtr> flags_;
};

// Escalating termination of a child process: SIGTERM once, SIGKILL after
// the grace period. Never throws; a process that already exited is fine.
class ProcessTerminator final {
public:
    ProcessTerminator(pid_t pid, std::chrono::milliseconds grace) noexcept;

    // Drives escalation; call on every poll iteration while the child runs.
    void poll(bool cancelRequested) noexcept;

    // Immediate SIGKILL (shutdown or unrecoverable I/O failure).
    void kill() noexcept;

    [[nodiscard]] bool terminateSent() const noexcept { return termSentAt_.has_value(); }
    [[nodiscard]] bool killSent() const noexcept { return killSent_; }

private:
    bool sendSignal(int sig) noexcept;

    pid_t pid_;
    std::chrono::milliseconds grace_;
    std::optional<std::chrono::steady_clock::time_point> termSentAt_;
    bool killSent_ = false;
};

}
