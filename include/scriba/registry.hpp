/*
 * scriba - Transcription Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "scriba/types.hpp"

namespace scriba {

// Owns every JobRecord. Readers get copies taken under the lock, so a
// status query never observes a half-applied update.
class JobRegistry {
public:
    using Mutator = std::function<void(JobRecord&)>;

    JobRegistry() = default;

    JobRegistry(const JobRegistry&) = delete;
    JobRegistry& operator=(const JobRegistry&) = delete;

    [[nodiscard]] JobId generateId();

    // Inserts a queued record; false if the id is already present.
    [[nodiscard]] bool create(const JobId& id, const std::string& modelName);

    [[nodiscard]] std::optional<JobRecord> get(const JobId& id) const;
    [[nodiscard]] std::vector<JobRecord> list() const;
    [[nodiscard]] bool exists(const JobId& id) const;
    [[nodiscard]] std::size_t size() const;

    // Applies fn to the live record under the lock. False if not found.
    bool update(const JobId& id, const Mutator& fn);

    bool erase(const JobId& id);

    // Removes terminal records whose endedAt is older than retention.
    std::size_t sweep(TimePoint now, std::chrono::seconds retention);

private:
    mutable std::mutex mutex_;
    std::unordered_map<JobId, JobRecord> records_;
};

}
