/*
 * scriba - Transcription Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/executor.hpp"
#include "scriba/cancellation.hpp"
#include "scriba/logger.hpp"
#include "scriba/subprocess.hpp"
#include "scriba/transcript.hpp"
#include <optional>
#include <stdexcept>
#include <thread>

namespace scriba {

namespace {

constexpr std::size_t kStderrTailBytes = 2048;

ExecutionOutcome failed(ErrorCode code, std::string message) {
    ExecutionOutcome out;
    out.status = ExecutionStatus::Failed;
    out.error = code;
    out.message = std::move(message);
    return out;
}

ExecutionOutcome canceled(std::string message = "Job canceled") {
    ExecutionOutcome out;
    out.status = ExecutionStatus::Canceled;
    out.error = ErrorCode::Canceled;
    out.message = std::move(message);
    return out;
}

}

ExecutionOutcome InProcessExecutor::execute(const WorkRequest& request, ModelLease& lease,
                                            const CancelToken& token, const EventSink& sink) {
    if (!lease) {
        return failed(ErrorCode::UnexpectedInternal, "No model lease held");
    }

    sink(PhaseChange{Phase::Transcribing, "Transcription started"});

    InferenceHooks hooks;
    hooks.shouldAbort = [&token] { return token.isCanceled(); };
    hooks.onProgress = [&sink](double percent) { sink(ProgressReport{percent}); };
    hooks.onSegment = [&sink](const Segment& segment) {
        LOG_TRACE("[" + formatTimestamp(segment.start) + " --> " + formatTimestamp(segment.end) + "]" + segment.text);
        sink(TimestampProgress{segment.end});
    };

    InferenceResult inference;
    try {
        inference = lease.model().transcribe(request.audioPath, hooks);
    } catch (const std::exception& e) {
        LOG_ERROR("Transcription of job " + request.jobId + " threw: " + e.what());
        return failed(ErrorCode::ExecutionFailed, e.what());
    }

    if (inference.aborted || token.isCanceled()) {
        return canceled();
    }
    if (!inference.ok) {
        return failed(ErrorCode::ExecutionFailed,
                      inference.error.empty() ? "Transcription failed" : inference.error);
    }

    sink(PhaseChange{Phase::Finished, "Transcription completed"});

    ExecutionOutcome out;
    out.status = ExecutionStatus::Succeeded;
    out.result = std::move(inference.result);
    out.message = "Transcription completed";
    return out;
}

ProcessExecutor::ProcessExecutor(Options options) : options_(std::move(options)) {
    if (options_.workerBinary.empty()) {
        throw std::invalid_argument("ProcessExecutor requires a worker binary");
    }
    if (options_.pollInterval <= std::chrono::milliseconds(0)) {
        options_.pollInterval = std::chrono::milliseconds(100);
    }
}

ExecutionOutcome ProcessExecutor::execute(const WorkRequest& request, ModelLease& /*lease*/,
                                          const CancelToken& token, const EventSink& sink) {
    std::vector<std::string> argv;
    argv.reserve(options_.extraArgs.size() + 4);
    argv.push_back(options_.workerBinary);
    argv.insert(argv.end(), options_.extraArgs.begin(), options_.extraArgs.end());
    argv.push_back(request.audioPath.string());
    argv.push_back(request.outputPath.string());
    argv.push_back(request.modelName);

    std::unique_ptr<ChildProcess> child;
    try {
        child = ChildProcess::spawn(argv);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start worker for job " + request.jobId + ": " + e.what());
        return failed(ErrorCode::ExecutionFailed, e.what());
    }
    LOG_INFO("Job " + request.jobId + " running in worker pid " + std::to_string(child->pid()));

    ProcessTerminator terminator(child->pid(), options_.grace);
    StatusStreamDecoder outDecoder;
    StatusStreamDecoder errDecoder;

    std::optional<ErrorReport> reportedError;
    std::optional<CanceledReport> reportedCancel;
    std::string stderrTail;

    auto dispatch = [&](std::vector<StatusEvent> events, Channel channel) {
        for (auto& event : events) {
            std::visit(Overloaded{
                [&](const ErrorReport& e) {
                    LOG_WARN("Worker reported error for job " + request.jobId + ": " + e.message);
                    if (!reportedError) reportedError = e;
                },
                [&](const CanceledReport& c) {
                    if (!reportedCancel) reportedCancel = c;
                },
                [&](const Unrecognized& u) {
                    if (channel == Channel::Stderr && !u.line.empty()) {
                        stderrTail += u.line;
                        stderrTail += '\n';
                        if (stderrTail.size() > kStderrTailBytes) {
                            stderrTail.erase(0, stderrTail.size() - kStderrTailBytes);
                        }
                    }
                    LOG_TRACE("worker: " + u.line);
                },
                [&](const auto& other) { sink(other); }
            }, event);
        }
    };

    auto handleChunks = [&](const std::vector<ChannelChunk>& chunks) {
        for (const auto& chunk : chunks) {
            auto& decoder = chunk.channel == Channel::Stdout ? outDecoder : errDecoder;
            dispatch(decoder.feed(chunk.data), chunk.channel);
        }
    };

    auto stopRequested = [&] {
        return token.isCanceled() || reportedError.has_value() || reportedCancel.has_value();
    };

    ExitStatus exit;
    try {
        for (;;) {
            if (child->channelsOpen()) {
                handleChunks(child->read(options_.pollInterval));
            } else {
                std::this_thread::sleep_for(options_.pollInterval);
            }

            if (auto status = child->tryWait()) {
                exit = *status;
                break;
            }
            terminator.poll(stopRequested());
        }

        // Whatever the worker wrote before exiting is still in the pipes.
        while (child->channelsOpen()) {
            auto chunks = child->read(options_.pollInterval);
            if (chunks.empty()) {
                break;
            }
            handleChunks(chunks);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Lost contact with worker for job " + request.jobId + ": " + e.what());
        terminator.kill();
        (void)child->wait();
        return failed(ErrorCode::ExecutionFailed, e.what());
    }
    dispatch(outDecoder.finish(), Channel::Stdout);
    dispatch(errDecoder.finish(), Channel::Stderr);

    LOG_DEBUG("Worker for job " + request.jobId + " finished: " + exit.describe());

    if (token.isCanceled()) {
        return canceled();
    }
    if (reportedCancel) {
        return canceled(reportedCancel->message);
    }
    if (reportedError) {
        return failed(ErrorCode::ExecutionFailed, reportedError->message);
    }
    if (exit.success()) {
        auto artifact = readResultArtifact(request.outputPath);
        if (artifact.missing) {
            return failed(ErrorCode::OutputMissing, artifact.error);
        }
        if (!artifact) {
            return failed(ErrorCode::ExecutionFailed, artifact.error);
        }
        ExecutionOutcome out;
        out.status = ExecutionStatus::Succeeded;
        out.result = std::move(artifact.result);
        out.message = "Transcription completed";
        return out;
    }

    std::string message = "Worker process failed (" + exit.describe() + ")";
    while (!stderrTail.empty() && (stderrTail.back() == '\n' || stderrTail.back() == ' ')) {
        stderrTail.pop_back();
    }
    if (!stderrTail.empty()) {
        message += ": " + stderrTail;
    }
    return failed(ErrorCode::ExecutionFailed, message);
}

WorkerModelReservation::WorkerModelReservation(std::string name, std::filesystem::path modelPath, std::uint64_t bytes)
    : name_(std::move(name)), modelPath_(std::move(modelPath)), bytes_(bytes) {
}

InferenceResult WorkerModelReservation::transcribe(const std::filesystem::path& /*audioPath*/,
                                                   const InferenceHooks& /*hooks*/) {
    InferenceResult out;
    out.error = "Model '" + name_ + "' is loaded by the worker process";
    return out;
}

WorkerModelLoader::WorkerModelLoader(std::filesystem::path modelsDir) : modelsDir_(std::move(modelsDir)) {
}

std::unique_ptr<ModelInstance> WorkerModelLoader::load(const std::string& modelName) {
    auto path = resolveModelPath(modelsDir_, modelName);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw std::runtime_error("Model file not found: " + path.string());
    }
    auto bytes = std::filesystem::file_size(path, ec);
    return std::make_unique<WorkerModelReservation>(modelName, path, ec ? 0 : static_cast<std::uint64_t>(bytes));
}

}
