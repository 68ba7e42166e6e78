/*
 * scriba - Transcription Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <optional>

namespace scriba {

// Turns segment timestamps into a 0-100 percentage that never goes down.
// Returned values are the new progress to store; nullopt means "no change".
class ProgressEstimator {
public:
    using SteadyClock = std::chrono::steady_clock;

    explicit ProgressEstimator(std::chrono::milliseconds minInterval = std::chrono::milliseconds(0)) noexcept
        : minInterval_(minInterval) {}

    [[nodiscard]] std::optional<double> update(double currentSeconds, double totalDurationSeconds) noexcept {
        return update(currentSeconds, totalDurationSeconds, SteadyClock::now());
    }
    [[nodiscard]] std::optional<double> update(double currentSeconds, double totalDurationSeconds,
                                               SteadyClock::time_point now) noexcept;

    // Progress reported by the unit of work. Wins over derived estimates
    // arriving in the same interval.
    [[nodiscard]] std::optional<double> applyExplicit(double percent) noexcept {
        return applyExplicit(percent, SteadyClock::now());
    }
    [[nodiscard]] std::optional<double> applyExplicit(double percent, SteadyClock::time_point now) noexcept;

    [[nodiscard]] double complete() noexcept;

    [[nodiscard]] double current() const noexcept { return current_; }

    [[nodiscard]] static double round2(double value) noexcept;

private:
    std::chrono::milliseconds minInterval_;
    double current_ = 0.0;
    std::optional<SteadyClock::time_point> lastDerivedAt_;
    std::optional<SteadyClock::time_point> lastExplicitAt_;
};

}
