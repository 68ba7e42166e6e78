/*
 * scriba - Transcription Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/orchestrator.hpp"
#include "scriba/decoder.hpp"
#include "scriba/executor.hpp"
#include "scriba/logger.hpp"
#include "scriba/pool.hpp"
#include "scriba/probe.hpp"
#include "scriba/progress.hpp"
#include <chrono>
#include <stdexcept>

namespace scriba {

namespace {

OrchestratorDeps checked(OrchestratorDeps deps) {
    if (!deps.loader) {
        throw std::invalid_argument("JobOrchestrator requires a model loader");
    }
    if (!deps.probe) {
        throw std::invalid_argument("JobOrchestrator requires a duration probe");
    }
    if (!deps.executor) {
        throw std::invalid_argument("JobOrchestrator requires an executor");
    }
    return deps;
}

SubmitResult rejected(ErrorCode code, std::string message) {
    SubmitResult out;
    out.error = code;
    out.message = std::move(message);
    return out;
}

}

bool isValidModelName(const std::string& name) noexcept {
    if (name.empty() || name.size() > 128 || name.find("..") != std::string::npos) {
        return false;
    }
    for (char c : name) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                        (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
        if (!ok) {
            return false;
        }
    }
    return true;
}

JobOrchestrator::JobOrchestrator(ServiceConfig config, OrchestratorDeps deps)
    : config_(std::move(config)),
      deps_(checked(std::move(deps))),
      cancellation_(registry_),
      gate_(config_.maxConcurrency),
      models_(deps_.loader, deps_.sibling,
              std::chrono::duration_cast<std::chrono::milliseconds>(config_.modelIdleTimeout)) {
}

JobOrchestrator::~JobOrchestrator() {
    shutdown();
}

bool JobOrchestrator::start() {
    if (running_.load()) {
        LOG_WARN("Orchestrator already running");
        return false;
    }

    LOG_INFO("Starting scriba orchestrator...");

    if (!prepareWorkspace()) {
        LOG_ERROR("Failed to create temp directories under " + config_.tempDir.string());
        return false;
    }

    LOG_DEBUG("Models: " + config_.modelsDir.string());
    LOG_DEBUG("Temp: " + config_.tempDir.string());
    LOG_DEBUG("Executor: " + std::string(deps_.executor->name()));
    LOG_DEBUG("Max concurrency: " + std::to_string(gate_.capacity()));
    LOG_DEBUG("Model idle timeout: " + std::to_string(config_.modelIdleTimeout.count()) + "s");

    try {
        shutdown_.store(false);
        pool_ = std::make_unique<Pool>(config_.driverThreads);
        if (!pool_->start([this](const JobId& id, int /*driverId*/) { drive(id); })) {
            LOG_ERROR("Failed to start driver pool");
            pool_.reset();
            return false;
        }

        running_.store(true);
        sweeperThread_ = std::thread(&JobOrchestrator::sweepLoop, this);

        LOG_DEBUG("Orchestrator started");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start orchestrator: " + std::string(e.what()));
        shutdown();
        return false;
    }
}

void JobOrchestrator::shutdown() noexcept {
    if (!running_.load() && !pool_) {
        return;
    }

    LOG_INFO("Shutting down orchestrator...");

    running_.store(false);
    shutdown_.store(true);

    std::vector<JobId> live;
    {
        std::lock_guard<std::mutex> lock(contextsMutex_);
        live.reserve(contexts_.size());
        for (const auto& entry : contexts_) {
            live.push_back(entry.first);
        }
    }
    for (const auto& id : live) {
        try {
            (void)cancel(id);
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to cancel job " + id + " during shutdown: " + e.what());
        }
    }

    if (pool_) {
        pool_->stop([this](const JobId& id) {
            auto ctx = context(id);
            if (ctx && !ctx->claimed.exchange(true)) {
                finish(id, *ctx, Terminal{JobStatus::Canceled, std::nullopt, ErrorCode::Canceled,
                                          "Job canceled by shutdown"});
            }
        });
        pool_.reset();
    }

    if (sweeperThread_.joinable()) {
        sweeperThread_.join();
    }

    models_.unload();

    LOG_INFO("Orchestrator shutdown complete");
}

bool JobOrchestrator::prepareWorkspace() noexcept {
    try {
        std::filesystem::create_directories(config_.inputDir());
        std::filesystem::create_directories(config_.outputDir());

        // Artifacts left by a previous run have no job to belong to.
        int stale = 0;
        for (const auto& entry : std::filesystem::directory_iterator(config_.outputDir())) {
            if (entry.is_regular_file()) {
                std::error_code ec;
                if (std::filesystem::remove(entry.path(), ec)) {
                    ++stale;
                }
            }
        }
        if (stale > 0) {
            LOG_INFO("Removed " + std::to_string(stale) + " stale result artifacts");
        }
        return true;
    } catch (const std::filesystem::filesystem_error& e) {
        LOG_ERROR("Workspace error: " + std::string(e.what()));
        return false;
    }
}

SubmitResult JobOrchestrator::submit(const SubmitRequest& request) {
    if (!running_.load()) {
        return rejected(ErrorCode::UnexpectedInternal, "Service is not accepting jobs");
    }

    if (!isValidModelName(request.modelName)) {
        return rejected(ErrorCode::InvalidInput, "Invalid model name: '" + request.modelName + "'");
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(request.audioPath, ec)) {
        return rejected(ErrorCode::InvalidInput, "Audio file not found: " + request.audioPath.string());
    }
    const auto size = std::filesystem::file_size(request.audioPath, ec);
    if (ec || size == 0) {
        return rejected(ErrorCode::InvalidInput, "Audio file is empty: " + request.audioPath.string());
    }

    const JobId id = registry_.generateId();
    if (!registry_.create(id, request.modelName)) {
        return rejected(ErrorCode::UnexpectedInternal, "Job id collision: " + id);
    }

    auto ctx = std::make_shared<JobContext>();
    ctx->request = request;
    ctx->token = cancellation_.registerJob(id);
    ctx->outputPath = config_.outputDir() / (id + ".json");
    {
        std::lock_guard<std::mutex> lock(contextsMutex_);
        contexts_.emplace(id, ctx);
    }

    if (!pool_ || !pool_->submit(id)) {
        ctx->claimed.store(true);
        finish(id, *ctx, Terminal{JobStatus::Failed, std::nullopt, ErrorCode::UnexpectedInternal,
                                  "Service is shutting down"});
        return rejected(ErrorCode::UnexpectedInternal, "Service is shutting down");
    }

    LOG_INFO("Job " + id + " queued (model " + request.modelName + ", " + std::to_string(size) + " bytes)");

    SubmitResult out;
    out.ok = true;
    out.id = id;
    out.message = "Job queued";
    return out;
}

CancelOutcome JobOrchestrator::cancel(const JobId& id) {
    const CancelOutcome outcome = cancellation_.requestCancel(id);
    if (outcome != CancelOutcome::Accepted) {
        return outcome;
    }

    // Waiters at the gate re-check their tokens.
    gate_.interrupt();

    // Nobody is driving it yet, so nothing has to stop: finalize here.
    auto ctx = context(id);
    if (ctx && !ctx->claimed.exchange(true)) {
        finish(id, *ctx, Terminal{JobStatus::Canceled, std::nullopt, ErrorCode::Canceled,
                                  "Job canceled before it started"});
    }
    return outcome;
}

std::optional<JobRecord> JobOrchestrator::status(const JobId& id) const {
    return registry_.get(id);
}

std::vector<JobRecord> JobOrchestrator::list() const {
    return registry_.list();
}

bool JobOrchestrator::unloadModel() {
    return models_.unload();
}

ModelStatus JobOrchestrator::modelStatus() const {
    return models_.status();
}

std::size_t JobOrchestrator::sweep() {
    const std::size_t removed = registry_.sweep(Clock::now(), config_.jobRetention);
    if (removed > 0) {
        LOG_INFO("Swept " + std::to_string(removed) + " finished jobs");
    }
    return removed;
}

std::size_t JobOrchestrator::liveJobs() const {
    std::lock_guard<std::mutex> lock(contextsMutex_);
    return contexts_.size();
}

JobOrchestrator::ContextPtr JobOrchestrator::context(const JobId& id) const {
    std::lock_guard<std::mutex> lock(contextsMutex_);
    auto it = contexts_.find(id);
    return it == contexts_.end() ? nullptr : it->second;
}

void JobOrchestrator::setPhase(const JobId& id, JobStatus status, const std::string& message) {
    registry_.update(id, [&](JobRecord& record) {
        if (isTerminal(record.status) || record.status == JobStatus::Canceling) {
            return;
        }
        record.status = status;
        record.message = message;
    });
}

void JobOrchestrator::drive(const JobId& id) {
    auto ctx = context(id);
    if (!ctx) {
        LOG_DEBUG("Job " + id + " no longer live, skipping");
        return;
    }
    if (ctx->claimed.exchange(true)) {
        LOG_DEBUG("Job " + id + " was finalized before it was claimed");
        return;
    }

    JobLogScope scope(id);
    try {
        runJob(id, *ctx);
    } catch (const std::exception& e) {
        LOG_ERROR("Unexpected error driving job " + id + ": " + e.what());
        finish(id, *ctx, Terminal{JobStatus::Failed, std::nullopt, ErrorCode::UnexpectedInternal,
                                  "Unexpected internal error"});
    }
}

void JobOrchestrator::runJob(const JobId& id, JobContext& ctx) {
    const SubmitRequest& request = ctx.request;
    CancelToken& token = *ctx.token;

    if (!gate_.admit(&token)) {
        finish(id, ctx, Terminal{JobStatus::Canceled, std::nullopt, ErrorCode::Canceled,
                                 "Job canceled while queued"});
        return;
    }
    GateSlot slot(gate_);
    ModelLease lease;

    auto conclude = [&](Terminal terminal) {
        lease.release();
        slot.release();
        finish(id, ctx, std::move(terminal));
    };

    registry_.update(id, [&](JobRecord& record) {
        record.startedAt = Clock::now();
        if (record.status == JobStatus::Queued) {
            record.status = JobStatus::ModelLoading;
            record.message = "Loading model '" + request.modelName + "'";
        }
    });
    LOG_INFO("Job " + id + " admitted");

    if (token.isCanceled()) {
        conclude(Terminal{JobStatus::Canceled, std::nullopt, ErrorCode::Canceled, "Job canceled before model load"});
        return;
    }

    const auto duration = deps_.probe->probe(request.audioPath);
    if (!duration) {
        conclude(Terminal{JobStatus::Failed, std::nullopt, ErrorCode::DurationProbeFailed,
                          "Could not determine audio duration"});
        return;
    }
    double totalSeconds = *duration;
    registry_.update(id, [&](JobRecord& record) { record.audioDuration = totalSeconds; });
    LOG_DEBUG("Job " + id + " audio duration " + std::to_string(totalSeconds) + "s");

    auto acquired = models_.acquire(request.modelName);
    if (!acquired) {
        conclude(Terminal{JobStatus::Failed, std::nullopt, acquired.error, acquired.message});
        return;
    }
    lease = std::move(acquired.lease);
    const std::string device = lease.model().device();
    registry_.update(id, [&](JobRecord& record) { record.device = device; });

    if (token.isCanceled()) {
        conclude(Terminal{JobStatus::Canceled, std::nullopt, ErrorCode::Canceled, "Job canceled before transcription"});
        return;
    }

    setPhase(id, JobStatus::Transcribing, "Transcribing audio");

    ProgressEstimator progress(config_.progressInterval);
    auto storeProgress = [&](std::optional<double> value) {
        if (!value) {
            return;
        }
        registry_.update(id, [&](JobRecord& record) {
            if (!isTerminal(record.status) && *value > record.progress) {
                record.progress = *value;
            }
        });
    };

    EventSink sink = [&](const StatusEvent& event) {
        std::visit(Overloaded{
            [&](const DurationInfo& info) {
                totalSeconds = info.seconds;
                registry_.update(id, [&](JobRecord& record) {
                    if (!record.audioDuration) {
                        record.audioDuration = info.seconds;
                    }
                });
            },
            [&](const DeviceInfo& info) {
                registry_.update(id, [&](JobRecord& record) {
                    if (info.code == "device" && !info.message.empty()) {
                        record.device = info.message;
                    } else if (!isTerminal(record.status) && record.status != JobStatus::Canceling) {
                        record.message = info.message;
                    }
                });
            },
            [&](const PhaseChange& change) {
                switch (change.phase) {
                    case Phase::ModelLoading:
                        setPhase(id, JobStatus::ModelLoading,
                                 change.message.empty() ? "Loading model '" + request.modelName + "'" : change.message);
                        break;
                    case Phase::ModelDownloading:
                        setPhase(id, JobStatus::ModelDownloading,
                                 change.message.empty() ? "Downloading model" : change.message);
                        break;
                    case Phase::ModelLoaded:
                        setPhase(id, JobStatus::ModelLoading,
                                 change.message.empty() ? "Model loaded" : change.message);
                        break;
                    case Phase::Transcribing:
                        setPhase(id, JobStatus::Transcribing,
                                 change.message.empty() ? "Transcribing audio" : change.message);
                        break;
                    case Phase::Finished:
                        break;
                }
            },
            [&](const ProgressReport& report) { storeProgress(progress.applyExplicit(report.percent)); },
            [&](const TimestampProgress& stamp) { storeProgress(progress.update(stamp.seconds, totalSeconds)); },
            [&](const auto& /*other*/) {}
        }, event);
    };

    WorkRequest work;
    work.jobId = id;
    work.audioPath = request.audioPath;
    work.modelName = request.modelName;
    work.outputPath = ctx.outputPath;
    work.audioDuration = totalSeconds;

    ExecutionOutcome outcome = deps_.executor->execute(work, lease, token, sink);

    switch (outcome.status) {
        case ExecutionStatus::Succeeded:
            conclude(Terminal{JobStatus::Completed, std::move(outcome.result), ErrorCode::None,
                              outcome.message.empty() ? "Transcription completed" : outcome.message});
            break;
        case ExecutionStatus::Canceled:
            conclude(Terminal{JobStatus::Canceled, std::nullopt, ErrorCode::Canceled,
                              outcome.message.empty() ? "Job canceled" : outcome.message});
            break;
        case ExecutionStatus::Failed:
            conclude(Terminal{JobStatus::Failed, std::nullopt,
                              outcome.error == ErrorCode::None ? ErrorCode::ExecutionFailed : outcome.error,
                              outcome.message.empty() ? "Transcription failed" : outcome.message});
            break;
    }
}

void JobOrchestrator::finish(const JobId& id, JobContext& ctx, Terminal terminal) noexcept {
    if (ctx.finalized.exchange(true)) {
        return;
    }

    // An accepted cancel always resolves to canceled once the work stops.
    if (terminal.status != JobStatus::Canceled && ctx.token && ctx.token->isCanceled()) {
        terminal = Terminal{JobStatus::Canceled, std::nullopt, ErrorCode::Canceled, "Job canceled"};
    }

    try {
        std::error_code ec;
        if (ctx.request.temporary && std::filesystem::exists(ctx.request.audioPath, ec)) {
            if (!std::filesystem::remove(ctx.request.audioPath, ec) && ec) {
                LOG_WARN("Failed to delete input " + ctx.request.audioPath.string() + ": " + ec.message());
            }
        }
        ec.clear();
        if (!std::filesystem::remove(ctx.outputPath, ec) && ec) {
            LOG_WARN("Failed to delete artifact " + ctx.outputPath.string() + ": " + ec.message());
        }

        cancellation_.clear(id);

        registry_.update(id, [&](JobRecord& record) {
            // A cancel accepted after the token check above still wins here,
            // under the same lock requestCancel uses for its transition.
            if (record.status == JobStatus::Canceling && terminal.status != JobStatus::Canceled) {
                terminal = Terminal{JobStatus::Canceled, std::nullopt, ErrorCode::Canceled, "Job canceled"};
            }
            const bool completed = terminal.status == JobStatus::Completed;
            record.status = terminal.status;
            record.endedAt = Clock::now();
            record.errorCode = terminal.error;
            record.message = terminal.message;
            if (completed) {
                record.result = std::move(terminal.result);
                record.error.reset();
                record.progress = 100.0;
            } else {
                record.result.reset();
                record.error = terminal.message;
            }
        });

        {
            std::lock_guard<std::mutex> lock(contextsMutex_);
            contexts_.erase(id);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to finalize job " + id + ": " + e.what());
    }

    if (terminal.status == JobStatus::Completed) {
        LOG_INFO("Job " + id + " completed");
    } else {
        LOG_WARN("Job " + id + " " + toString(terminal.status) + ": " + terminal.message);
    }
}

void JobOrchestrator::sweepLoop() {
    setThreadName("Sweeper");
    LOG_DEBUG("Sweeper loop started");

    while (!shutdown_.load()) {
        auto sleepEnd = std::chrono::steady_clock::now() + config_.sweepInterval;
        while (std::chrono::steady_clock::now() < sleepEnd && !shutdown_.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        if (shutdown_.load()) {
            break;
        }

        try {
            sweep();
        } catch (const std::exception& e) {
            LOG_ERROR("Sweeper loop error: " + std::string(e.what()));
        }
    }

    LOG_DEBUG("Sweeper loop stopped");
}

}
