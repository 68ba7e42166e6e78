/*
 * scriba - Transcription Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "scriba/types.hpp"

namespace scriba {

using JobDriver = std::function<void(const JobId&, int driverId)>;
using DroppedJob = std::function<void(const JobId&)>;

// Driver threads. Each claimed job is driven to a terminal state on the
// claiming thread; admission to inference is decided later by the gate.
class Pool {
public:
    explicit Pool(int drivers) noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start(JobDriver driver);
    // Joins the drivers after their current job. Ids nobody claimed are
    // handed to onDropped so the owner can finalize them.
    void stop(const DroppedJob& onDropped = {}) noexcept;
    [[nodiscard]] bool submit(const JobId& jobId) noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t queueSize() const noexcept;
    [[nodiscard]] int driverCount() const noexcept { return drivers_; }

private:
    void driverLoop(int driverId);

    int drivers_;
    JobDriver driver_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    mutable std::mutex queueMutex_;
    std::condition_variable jobAvailable_;
    std::queue<JobId> jobQueue_;

    std::vector<std::thread> driverThreads_;
};

}
