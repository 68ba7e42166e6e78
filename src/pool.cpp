/*
 * scriba - Transcription Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/pool.hpp"
#include "scriba/logger.hpp"

namespace scriba {

Pool::Pool(int drivers) noexcept : drivers_(drivers > 0 ? drivers : 1) {
    LOG_DEBUG("Pool created with " + std::to_string(drivers_) + " drivers");
}

Pool::~Pool() {
    stop();
}

bool Pool::start(JobDriver driver) {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }

    if (!driver) {
        LOG_ERROR("Invalid job driver provided");
        return false;
    }

    driver_ = std::move(driver);
    running_.store(true);
    shutdown_.store(false);

    try {
        driverThreads_.reserve(drivers_);
        for (int i = 0; i < drivers_; ++i) {
            driverThreads_.emplace_back(&Pool::driverLoop, this, i);
        }

        LOG_INFO("Pool started with " + std::to_string(drivers_) + " driver threads");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pool: " + std::string(e.what()));
        stop();
        return false;
    }
}

void Pool::stop(const DroppedJob& onDropped) noexcept {
    if (!running_.load() && driverThreads_.empty()) {
        return;
    }

    LOG_DEBUG("Stopping pool...");

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_.store(true);
        running_.store(false);
    }
    jobAvailable_.notify_all();

    for (auto& thread : driverThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    driverThreads_.clear();

    std::queue<JobId> unclaimed;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        unclaimed.swap(jobQueue_);
    }

    if (unclaimed.empty()) {
        LOG_INFO("Pool stopped");
        return;
    }

    LOG_WARN("Pool stopped with " + std::to_string(unclaimed.size()) + " unclaimed jobs");
    while (!unclaimed.empty()) {
        if (onDropped) {
            try {
                onDropped(unclaimed.front());
            } catch (const std::exception& e) {
                LOG_ERROR("Failed to drop job " + unclaimed.front() + ": " + e.what());
            }
        }
        unclaimed.pop();
    }
}

bool Pool::submit(const JobId& jobId) noexcept {
    if (!running_.load() || shutdown_.load()) {
        LOG_DEBUG("Cannot submit job to stopped pool: " + jobId);
        return false;
    }

    try {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            jobQueue_.push(jobId);
        }

        jobAvailable_.notify_one();
        LOG_DEBUG("Job queued: " + jobId);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to queue job " + jobId + ": " + e.what());
        return false;
    }
}

std::size_t Pool::queueSize() const noexcept {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return jobQueue_.size();
}

void Pool::driverLoop(int driverId) {
    setThreadName(driverThreadName(driverId));
    LOG_DEBUG("Driver thread started");

    while (!shutdown_.load()) {
        JobId jobId;

        {
            std::unique_lock<std::mutex> lock(queueMutex_);

            jobAvailable_.wait(lock, [this] {
                return !jobQueue_.empty() || shutdown_.load();
            });

            if (shutdown_.load()) {
                break;
            }

            jobId = jobQueue_.front();
            jobQueue_.pop();
        }

        // Drive outside of lock
        LOG_DEBUG("Claimed job: " + jobId);
        try {
            driver_(jobId, driverId);
        } catch (const std::exception& e) {
            LOG_ERROR("Driver error: " + std::string(e.what()) + " (job: " + jobId + ")");
        }
    }

    LOG_DEBUG("Driver thread stopped");
}

}
