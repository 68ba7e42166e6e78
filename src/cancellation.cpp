/*
 * scriba - Transcription Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/cancellation.hpp"
#include "scriba/registry.hpp"
#include "scriba/logger.hpp"
#include <cerrno>
#include <cstring>
#include <csignal>

namespace scriba {

const char* toString(CancelOutcome outcome) noexcept {
    switch (outcome) {
        case CancelOutcome::Accepted: return "accepted";
        case CancelOutcome::AlreadyCanceling: return "already_canceling";
        case CancelOutcome::AlreadyTerminal: return "already_terminal";
        case CancelOutcome::NotFound: return "not_found";
        default: return "unknown";
    }
}

CancellationController::CancellationController(JobRegistry& registry) noexcept
    : registry_(registry) {
}

CancelTokenPtr CancellationController::registerJob(const JobId& id) {
    auto token = std::make_shared<CancelToken>();
    std::lock_guard<std::mutex> lock(mutex_);
    flags_[id] = token;
    return token;
}

CancelOutcome CancellationController::requestCancel(const JobId& id) {
    CancelOutcome outcome = CancelOutcome::NotFound;

    // The registry lock makes the terminal check and the canceling
    // transition one step relative to the job's own terminal commit.
    bool found = registry_.update(id, [&](JobRecord& record) {
        if (isTerminal(record.status)) {
            outcome = CancelOutcome::AlreadyTerminal;
            return;
        }
        if (record.status == JobStatus::Canceling) {
            outcome = CancelOutcome::AlreadyCanceling;
            return;
        }
        record.status = JobStatus::Canceling;
        record.message = "Cancellation requested";
        outcome = CancelOutcome::Accepted;
    });

    if (!found) {
        return CancelOutcome::NotFound;
    }

    if (outcome == CancelOutcome::Accepted) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = flags_.find(id);
        if (it != flags_.end()) {
            it->second->cancel();
        }
        LOG_INFO("Cancellation requested for job " + id);
    } else {
        LOG_DEBUG("Cancel for job " + id + " ignored: " + toString(outcome));
    }
    return outcome;
}

bool CancellationController::isCanceled(const JobId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = flags_.find(id);
    return it != flags_.end() && it->second->isCanceled();
}

CancelTokenPtr CancellationController::token(const JobId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = flags_.find(id);
    return it == flags_.end() ? nullptr : it->second;
}

void CancellationController::clear(const JobId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    flags_.erase(id);
}

std::size_t CancellationController::trackedJobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return flags_.size();
}

ProcessTerminator::ProcessTerminator(pid_t pid, std::chrono::milliseconds grace) noexcept
    : pid_(pid), grace_(grace) {
}

void ProcessTerminator::poll(bool cancelRequested) noexcept {
    if (!cancelRequested || killSent_) {
        return;
    }

    if (!termSentAt_) {
        LOG_INFO("Sending SIGTERM to worker process " + std::to_string(pid_));
        sendSignal(SIGTERM);
        termSentAt_ = std::chrono::steady_clock::now();
        return;
    }

    if (std::chrono::steady_clock::now() - *termSentAt_ >= grace_) {
        LOG_WARN("Worker process " + std::to_string(pid_) + " did not exit within " +
                 std::to_string(grace_.count()) + "ms, sending SIGKILL");
        kill();
    }
}

void ProcessTerminator::kill() noexcept {
    if (killSent_) {
        return;
    }
    sendSignal(SIGKILL);
    killSent_ = true;
}

bool ProcessTerminator::sendSignal(int sig) noexcept {
    if (pid_ <= 0) {
        return false;
    }
    if (::kill(pid_, sig) == 0) {
        return true;
    }
    if (errno != ESRCH) {
        LOG_WARN("Failed to signal worker process " + std::to_string(pid_) + ": " + std::strerror(errno));
    }
    return false;
}

}
