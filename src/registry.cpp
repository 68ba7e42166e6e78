/*
 * scriba - Transcription Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/registry.hpp"
#include "scriba/logger.hpp"
#include <algorithm>
#include <atomic>
#include <sstream>
#include <unistd.h>

namespace scriba {

JobId JobRegistry::generateId() {
    static std::atomic<uint64_t> counter{0};

    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
    uint64_t unique_counter = counter.fetch_add(1);

    std::stringstream ss;
    ss << now << "_" << getpid() << "_" << unique_counter;
    return ss.str();
}

bool JobRegistry::create(const JobId& id, const std::string& modelName) {
    JobRecord record;
    record.id = id;
    record.status = JobStatus::Queued;
    record.modelName = modelName;
    record.message = "Job queued";
    record.submittedAt = Clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    return records_.emplace(id, std::move(record)).second;
}

std::optional<JobRecord> JobRegistry::get(const JobId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<JobRecord> JobRegistry::list() const {
    std::vector<JobRecord> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out.reserve(records_.size());
        for (const auto& entry : records_) {
            out.push_back(entry.second);
        }
    }
    std::sort(out.begin(), out.end(), [](const JobRecord& a, const JobRecord& b) {
        return a.submittedAt > b.submittedAt;
    });
    return out;
}

bool JobRegistry::exists(const JobId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.count(id) > 0;
}

std::size_t JobRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

bool JobRegistry::update(const JobId& id, const Mutator& fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return false;
    }
    fn(it->second);
    return true;
}

bool JobRegistry::erase(const JobId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.erase(id) > 0;
}

std::size_t JobRegistry::sweep(TimePoint now, std::chrono::seconds retention) {
    std::size_t removed = 0;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = records_.begin(); it != records_.end(); ) {
        const JobRecord& record = it->second;
        if (isTerminal(record.status) && record.endedAt && now - *record.endedAt > retention) {
            LOG_DEBUG("Cleaned up old job " + it->first);
            it = records_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

}
