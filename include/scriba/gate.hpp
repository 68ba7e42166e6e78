/*
 * scriba - Transcription Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>

namespace scriba {

class CancelToken;

// Counting admission gate. Waiters are admitted strictly in arrival order.
class ConcurrencyGate final {
public:
    explicit ConcurrencyGate(int capacity);

    ConcurrencyGate(const ConcurrencyGate&) = delete;
    ConcurrencyGate& operator=(const ConcurrencyGate&) = delete;

    // Blocks until a slot is free. Returns false without taking a slot if
    // the token is canceled while waiting.
    [[nodiscard]] bool admit(const CancelToken* token = nullptr);
    void release() noexcept;

    // Wakes all waiters so they re-check their cancel tokens.
    void interrupt() noexcept;

    [[nodiscard]] int capacity() const noexcept { return capacity_; }
    [[nodiscard]] int inUse() const noexcept;
    [[nodiscard]] std::size_t waiting() const noexcept;

private:
    const int capacity_;
    int inUse_ = 0;
    uint64_t nextTicket_ = 0;
    std::deque<uint64_t> queue_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

// Owns one admitted slot and gives it back on destruction.
class GateSlot final {
public:
    GateSlot() noexcept = default;
    explicit GateSlot(ConcurrencyGate& gate) noexcept : gate_(&gate) {}
    ~GateSlot() { release(); }

    GateSlot(const GateSlot&) = delete;
    GateSlot& operator=(const GateSlot&) = delete;
    GateSlot(GateSlot&& other) noexcept : gate_(other.gate_) { other.gate_ = nullptr; }
    GateSlot& operator=(GateSlot&& other) noexcept;

    void release() noexcept;
    [[nodiscard]] bool held() const noexcept { return gate_ != nullptr; }

private:
    ConcurrencyGate* gate_ = nullptr;
};

}
