/*
 * scriba - Transcription Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/subprocess.hpp"
#include "scriba/logger.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <stdexcept>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace scriba {

namespace {
std::runtime_error sysError(const std::string& what, int err) {
    return std::runtime_error(what + ": " + std::strerror(err));
}

ExitStatus decodeWaitStatus(int status) {
    ExitStatus out;
    if (WIFEXITED(status)) {
        out.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        out.signal = WTERMSIG(status);
    }
    return out;
}
}

std::string ExitStatus::describe() const {
    if (signal) {
        return "killed by signal " + std::to_string(*signal);
    }
    return "exit code " + std::to_string(code);
}

std::unique_ptr<ChildProcess> ChildProcess::spawn(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        throw std::invalid_argument("ChildProcess::spawn requires a program");
    }

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (::pipe2(outPipe, O_CLOEXEC) != 0) {
        throw sysError("pipe", errno);
    }
    if (::pipe2(errPipe, O_CLOEXEC) != 0) {
        int err = errno;
        ::close(outPipe[0]);
        ::close(outPipe[1]);
        throw sysError("pipe", err);
    }

    auto closeAll = [&] {
        for (int fd : {outPipe[0], outPipe[1], errPipe[0], errPipe[1]}) {
            if (fd >= 0) ::close(fd);
        }
    };

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, outPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, errPipe[1], STDERR_FILENO);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) {
        args.push_back(const_cast<char*>(a.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = -1;
    int rc = posix_spawnp(&pid, args[0], &actions, nullptr, args.data(), environ);
    posix_spawn_file_actions_destroy(&actions);

    if (rc != 0) {
        closeAll();
        throw sysError("Failed to spawn " + argv[0], rc);
    }

    ::close(outPipe[1]);
    ::close(errPipe[1]);
    ::fcntl(outPipe[0], F_SETFL, ::fcntl(outPipe[0], F_GETFL) | O_NONBLOCK);
    ::fcntl(errPipe[0], F_SETFL, ::fcntl(errPipe[0], F_GETFL) | O_NONBLOCK);

    LOG_DEBUG("Spawned " + argv[0] + " as pid " + std::to_string(pid));
    return std::unique_ptr<ChildProcess>(new ChildProcess(pid, outPipe[0], errPipe[0]));
}

ChildProcess::~ChildProcess() {
    closeFd(outFd_);
    closeFd(errFd_);
    if (!exit_ && pid_ > 0) {
        // Never leave a zombie or an orphaned worker behind.
        if (::kill(pid_, SIGKILL) != 0 && errno != ESRCH) {
            LOG_WARN("Failed to kill child " + std::to_string(pid_) + ": " + std::strerror(errno));
        }
        (void)wait();
    }
}

void ChildProcess::closeFd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

std::vector<ChannelChunk> ChildProcess::read(std::chrono::milliseconds timeout) {
    std::vector<ChannelChunk> chunks;

    pollfd fds[2];
    Channel channels[2];
    int* owners[2];
    nfds_t n = 0;
    if (outFd_ >= 0) { fds[n] = {outFd_, POLLIN, 0}; channels[n] = Channel::Stdout; owners[n] = &outFd_; ++n; }
    if (errFd_ >= 0) { fds[n] = {errFd_, POLLIN, 0}; channels[n] = Channel::Stderr; owners[n] = &errFd_; ++n; }
    if (n == 0) {
        return chunks;
    }

    int ready = ::poll(fds, n, static_cast<int>(timeout.count()));
    if (ready < 0) {
        if (errno == EINTR) {
            return chunks;
        }
        throw sysError("poll", errno);
    }
    if (ready == 0) {
        return chunks;
    }

    char buf[65536];
    for (nfds_t i = 0; i < n; ++i) {
        if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
            continue;
        }
        for (;;) {
            ssize_t got = ::read(fds[i].fd, buf, sizeof(buf));
            if (got > 0) {
                chunks.push_back({channels[i], std::string(buf, static_cast<std::size_t>(got))});
                continue;
            }
            if (got == 0) {
                closeFd(*owners[i]);
            } else if (errno == EINTR) {
                continue;
            } else if (errno != EAGAIN && errno != EWOULDBLOCK) {
                LOG_WARN("Read error on child channel: " + std::string(std::strerror(errno)));
                closeFd(*owners[i]);
            }
            break;
        }
    }
    return chunks;
}

std::optional<ExitStatus> ChildProcess::tryWait() {
    if (exit_) {
        return exit_;
    }
    int status = 0;
    pid_t rc = ::waitpid(pid_, &status, WNOHANG);
    if (rc == pid_) {
        exit_ = decodeWaitStatus(status);
        return exit_;
    }
    if (rc < 0 && errno != EINTR) {
        LOG_WARN("waitpid failed for " + std::to_string(pid_) + ": " + std::strerror(errno));
        exit_ = ExitStatus{};
        return exit_;
    }
    return std::nullopt;
}

ExitStatus ChildProcess::wait() {
    if (exit_) {
        return *exit_;
    }
    int status = 0;
    for (;;) {
        pid_t rc = ::waitpid(pid_, &status, 0);
        if (rc == pid_) {
            exit_ = decodeWaitStatus(status);
            break;
        }
        if (rc < 0 && errno == EINTR) {
            continue;
        }
        LOG_WARN("waitpid failed for " + std::to_string(pid_) + ": " + std::strerror(errno));
        exit_ = ExitStatus{};
        break;
    }
    return *exit_;
}

CaptureResult runCapture(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) noexcept {
    CaptureResult out;
    try {
        auto child = ChildProcess::spawn(argv);
        auto deadline = std::chrono::steady_clock::now() + timeout;

        while (child->channelsOpen()) {
            if (std::chrono::steady_clock::now() >= deadline) {
                ::kill(child->pid(), SIGKILL);
                out.exit = child->wait();
                out.error = argv[0] + " timed out";
                return out;
            }
            for (auto& chunk : child->read(std::chrono::milliseconds(100))) {
                (chunk.channel == Channel::Stdout ? out.out : out.err) += chunk.data;
            }
        }

        out.exit = child->wait();
        out.ok = out.exit.success();
        if (!out.ok) {
            out.error = argv[0] + " failed (" + out.exit.describe() + ")";
        }
        return out;
    } catch (const std::exception& e) {
        out.error = e.what();
        return out;
    }
}

}
