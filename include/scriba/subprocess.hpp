/*
 * scriba - Transcription Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

namespace scriba {

enum class Channel : uint8_t { Stdout = 0, Stderr = 1 };

struct ChannelChunk {
    Channel channel = Channel::Stdout;
    std::string data;
};

struct ExitStatus {
    int code = -1;                 // exit code, or -1 when killed by a signal
    std::optional<int> signal;
    [[nodiscard]] bool success() const noexcept { return code == 0 && !signal; }
    [[nodiscard]] std::string describe() const;
};

// Child process with stdout/stderr piped back to us. Spawned with
// posix_spawnp so it is safe to start from any driver thread.
class ChildProcess final {
public:
    // Throws std::runtime_error if the pipes or the spawn fail.
    [[nodiscard]] static std::unique_ptr<ChildProcess> spawn(const std::vector<std::string>& argv);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&&) = delete;
    ChildProcess& operator=(ChildProcess&&) = delete;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

    // Waits up to timeout for output on any open channel. A channel that
    // reaches EOF is closed.
    [[nodiscard]] std::vector<ChannelChunk> read(std::chrono::milliseconds timeout);
    [[nodiscard]] bool channelsOpen() const noexcept { return outFd_ >= 0 || errFd_ >= 0; }

    // Non-blocking reap.
    [[nodiscard]] std::optional<ExitStatus> tryWait();
    ExitStatus wait();
    [[nodiscard]] bool reaped() const noexcept { return exit_.has_value(); }

private:
    ChildProcess(pid_t pid, int outFd, int errFd) noexcept : pid_(pid), outFd_(outFd), errFd_(errFd) {}
    void closeFd(int& fd) noexcept;

    pid_t pid_ = -1;
    int outFd_ = -1;
    int errFd_ = -1;
    std::optional<ExitStatus> exit_;
};

struct CaptureResult {
    bool ok = false;
    ExitStatus exit;
    std::string out;
    std::string err;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

// Runs argv to completion, collecting both channels. Kills it after timeout.
[[nodiscard]] CaptureResult runCapture(const std::vector<std::string>& argv,
                                       std::chrono::milliseconds timeout) noexcept;

}
