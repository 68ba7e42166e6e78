/*
 * scriba - Transcription Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/gate.hpp"
#include "scriba/cancellation.hpp"
#include "scriba/logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace scriba {

ConcurrencyGate::ConcurrencyGate(int capacity) : capacity_(capacity) {
    if (capacity <= 0) {
        throw std::invalid_argument("ConcurrencyGate capacity must be positive");
    }
    LOG_DEBUG("Concurrency gate created with capacity " + std::to_string(capacity));
}

bool ConcurrencyGate::admit(const CancelToken* token) {
    std::unique_lock<std::mutex> lock(mutex_);
    const uint64_t ticket = nextTicket_++;
    queue_.push_back(ticket);

    cv_.wait(lock, [&] {
        if (token && token->isCanceled()) {
            return true;
        }
        return queue_.front() == ticket && inUse_ < capacity_;
    });

    if (token && token->isCanceled()) {
        queue_.erase(std::find(queue_.begin(), queue_.end(), ticket));
        lock.unlock();
        // The head of the queue may have changed.
        cv_.notify_all();
        return false;
    }

    queue_.pop_front();
    ++inUse_;
    lock.unlock();
    // Capacity above one lets the next ticket in as well.
    cv_.notify_all();
    return true;
}

void ConcurrencyGate::release() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (inUse_ == 0) {
            LOG_ERROR("Concurrency gate released more often than admitted");
            return;
        }
        --inUse_;
    }
    cv_.notify_all();
}

void ConcurrencyGate::interrupt() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
    }
    cv_.notify_all();
}

int ConcurrencyGate::inUse() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return inUse_;
}

std::size_t ConcurrencyGate::waiting() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

GateSlot& GateSlot::operator=(GateSlot&& other) noexcept {
    if (this != &other) {
        release();
        gate_ = other.gate_;
        other.gate_ = nullptr;
    }
    return *this;
}

void GateSlot::release() noexcept {
    if (gate_) {
        gate_->release();
        gate_ = nullptr;
    }
}

}
