/*
 * scriba - Transcription Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/progress.hpp"
#include <algorithm>
#include <cmath>

namespace scriba {

double ProgressEstimator::round2(double value) noexcept {
    return std::round(value * 100.0) / 100.0;
}

std::optional<double> ProgressEstimator::update(double currentSeconds, double totalDurationSeconds,
                                                SteadyClock::time_point now) noexcept {
    // Unknown duration: nothing to estimate against.
    if (!(totalDurationSeconds > 0.0) || !std::isfinite(currentSeconds) || currentSeconds < 0.0) {
        return std::nullopt;
    }
    if (lastExplicitAt_ && now - *lastExplicitAt_ < minInterval_) {
        return std::nullopt;
    }
    if (lastDerivedAt_ && now - *lastDerivedAt_ < minInterval_) {
        return std::nullopt;
    }

    double percent = round2(std::min(currentSeconds / totalDurationSeconds * 100.0, 100.0));
    if (percent <= current_) {
        return std::nullopt;
    }
    current_ = percent;
    lastDerivedAt_ = now;
    return current_;
}

std::optional<double> ProgressEstimator::applyExplicit(double percent, SteadyClock::time_point now) noexcept {
    if (!std::isfinite(percent)) {
        return std::nullopt;
    }
    double clamped = round2(std::clamp(percent, 0.0, 100.0));
    lastExplicitAt_ = now;
    if (clamped <= current_) {
        return std::nullopt;
    }
    current_ = clamped;
    return current_;
}

double ProgressEstimator::complete() noexcept {
    current_ = 100.0;
    return current_;
}

}
