/*
 * scriba - Transcription Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <atomic>
#include <chrono>
#include <fstream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "scriba/logger.hpp"
#include "scriba/orchestrator.hpp"
#include "test_support.hpp"

using namespace scriba;
using namespace std::chrono_literals;
using scriba::test::CountingSibling;
using scriba::test::FakeLoader;
using scriba::test::FakeProbe;
using scriba::test::ScriptedExecutor;
using scriba::test::TempDir;
using scriba::test::eventually;

namespace {

class JobOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.modelsDir = dir.path();
        config.tempDir = dir.path() / "tmp";
        config.maxConcurrency = 1;
        config.driverThreads = 4;
        config.progressInterval = 0ms;
        config.modelIdleTimeout = 0s;
        config.sweepInterval = 3600s;
        config.siblingUrl.clear();
    }

    void TearDown() override {
        Logger::setSink({});
        executor->release();
        if (orch) {
            orch->shutdown();
        }
    }

    void start(std::optional<double> duration = 12.5) {
        OrchestratorDeps deps;
        deps.loader = loader;
        deps.probe = std::make_shared<FakeProbe>(duration);
        deps.sibling = sibling;
        deps.executor = executor;
        orch = std::make_unique<JobOrchestrator>(config, deps);
        ASSERT_TRUE(orch->start());
    }

    std::filesystem::path audioFile() {
        return dir.write("audio-" + std::to_string(files++) + ".wav", "RIFF----WAVEfmt ");
    }

    JobId submit(const std::string& model, bool temporary = false) {
        auto result = orch->submit(SubmitRequest{audioFile(), model, temporary});
        EXPECT_TRUE(result) << result.message;
        return result.id;
    }

    std::optional<JobRecord> waitTerminal(const JobId& id) {
        EXPECT_TRUE(eventually([&] {
            auto record = orch->status(id);
            return record && isTerminal(record->status);
        })) << "job " << id << " never finished";
        return orch->status(id);
    }

    JobStatus statusOf(const JobId& id) {
        auto record = orch->status(id);
        return record ? record->status : JobStatus::Failed;
    }

    TempDir dir;
    int files = 0;
    ServiceConfig config;
    std::shared_ptr<FakeLoader> loader = std::make_shared<FakeLoader>();
    std::shared_ptr<CountingSibling> sibling = std::make_shared<CountingSibling>();
    std::shared_ptr<ScriptedExecutor> executor = std::make_shared<ScriptedExecutor>();
    std::unique_ptr<JobOrchestrator> orch;
};

TEST_F(JobOrchestratorTest, RequiresCollaborators) {
    OrchestratorDeps deps;
    deps.loader = loader;
    EXPECT_THROW({ JobOrchestrator orchestrator(config, deps); }, std::invalid_argument);
}

TEST_F(JobOrchestratorTest, SubmitRejectsInvalidInput) {
    start();

    auto missing = orch->submit(SubmitRequest{dir.path() / "nope.wav", "tiny", false});
    EXPECT_FALSE(missing);
    EXPECT_EQ(missing.error, ErrorCode::InvalidInput);

    auto empty = orch->submit(SubmitRequest{dir.write("empty.wav", ""), "tiny", false});
    EXPECT_FALSE(empty);
    EXPECT_EQ(empty.error, ErrorCode::InvalidInput);

    for (const char* bad : {"", "../tiny", "ti ny", "a/b"}) {
        auto result = orch->submit(SubmitRequest{audioFile(), bad, false});
        EXPECT_FALSE(result) << bad;
        EXPECT_EQ(result.error, ErrorCode::InvalidInput) << bad;
    }
    EXPECT_TRUE(orch->list().empty());
}

TEST_F(JobOrchestratorTest, ModelNameRules) {
    EXPECT_TRUE(isValidModelName("tiny"));
    EXPECT_TRUE(isValidModelName("large-v3"));
    EXPECT_TRUE(isValidModelName("base.en"));
    EXPECT_FALSE(isValidModelName(""));
    EXPECT_FALSE(isValidModelName(".."));
    EXPECT_FALSE(isValidModelName("tiny;rm"));
}

TEST_F(JobOrchestratorTest, CompletesWithTimestampProgress) {
    std::atomic<double> midway{-1.0};
    executor->script = [&](const WorkRequest& request, ModelLease& lease, const CancelToken&, const EventSink& sink) {
        EXPECT_EQ(lease.modelName(), "tiny");
        EXPECT_DOUBLE_EQ(request.audioDuration, 12.5);
        sink(TimestampProgress{6.25});
        midway = orch->status(request.jobId)->progress;
        sink(TimestampProgress{12.5});

        ExecutionOutcome out;
        out.status = ExecutionStatus::Succeeded;
        out.result.text = " hello world";
        out.result.language = "en";
        out.result.segments = {{0.0, 6.25, " hello"}, {6.25, 12.5, " world"}};
        return out;
    };
    start(12.5);

    const JobId id = submit("tiny");
    auto record = waitTerminal(id);
    ASSERT_TRUE(record);

    EXPECT_GE(midway.load(), 50.0);
    EXPECT_EQ(record->status, JobStatus::Completed);
    EXPECT_DOUBLE_EQ(record->progress, 100.0);
    ASSERT_TRUE(record->result.has_value());
    EXPECT_EQ(record->result->text, " hello world");
    EXPECT_EQ(record->result->segments.size(), 2u);
    EXPECT_FALSE(record->error.has_value());
    EXPECT_EQ(record->errorCode, ErrorCode::None);
    EXPECT_DOUBLE_EQ(record->audioDuration.value_or(0), 12.5);
    EXPECT_EQ(record->device.value_or(""), "cpu");
    EXPECT_TRUE(record->startedAt.has_value());
    ASSERT_TRUE(record->endedAt.has_value());
    EXPECT_GE(*record->endedAt, *record->startedAt);

    EXPECT_EQ(orch->gate().inUse(), 0);
    EXPECT_EQ(orch->modelStatus().activeJobs, 0);
    EXPECT_EQ(orch->liveJobs(), 0u);
}

TEST_F(JobOrchestratorTest, ProgressNeverDecreases) {
    std::vector<double> seen;
    executor->script = [&](const WorkRequest& request, ModelLease&, const CancelToken&, const EventSink& sink) {
        for (double t : {2.0, 6.0, 4.0, 6.0, 10.0}) {
            sink(TimestampProgress{t});
            seen.push_back(orch->status(request.jobId)->progress);
        }
        sink(ProgressReport{30.0});
        seen.push_back(orch->status(request.jobId)->progress);
        ExecutionOutcome out;
        out.status = ExecutionStatus::Succeeded;
        return out;
    };
    start(20.0);

    auto record = waitTerminal(submit("tiny"));
    ASSERT_TRUE(record);
    EXPECT_EQ(seen, (std::vector<double>{10.0, 30.0, 30.0, 30.0, 50.0, 50.0}));
    EXPECT_DOUBLE_EQ(record->progress, 100.0);
}

TEST_F(JobOrchestratorTest, SecondModelWaitsThenLoadsFresh) {
    executor->holdUntilReleased = true;
    start();

    const JobId first = submit("tiny");
    ASSERT_TRUE(executor->waitForStarted(1));
    const JobId second = submit("base");

    std::this_thread::sleep_for(200ms);
    EXPECT_EQ(statusOf(first), JobStatus::Transcribing);
    EXPECT_EQ(statusOf(second), JobStatus::Queued);
    EXPECT_EQ(executor->started().size(), 1u);
    EXPECT_EQ(orch->modelStatus().modelName.value_or(""), "tiny");
    EXPECT_EQ(orch->modelStatus().activeJobs, 1);

    executor->release();
    EXPECT_EQ(waitTerminal(first)->status, JobStatus::Completed);
    EXPECT_EQ(waitTerminal(second)->status, JobStatus::Completed);

    EXPECT_EQ(loader->loads(), (std::vector<std::string>{"tiny", "base"}));
    EXPECT_EQ(executor->started(), (std::vector<std::string>{"tiny", "base"}));
    EXPECT_EQ(orch->modelStatus().modelName.value_or(""), "base");
}

TEST_F(JobOrchestratorTest, SwitchWhileBusyFailsFast) {
    config.maxConcurrency = 2;
    executor->holdUntilReleased = true;
    start();

    const JobId first = submit("tiny");
    ASSERT_TRUE(executor->waitForStarted(1));
    const JobId second = submit("base");

    auto record = waitTerminal(second);
    ASSERT_TRUE(record);
    EXPECT_EQ(record->status, JobStatus::Failed);
    EXPECT_EQ(record->errorCode, ErrorCode::ResourceBusy);
    EXPECT_TRUE(record->error.has_value());
    EXPECT_FALSE(record->result.has_value());
    EXPECT_EQ(statusOf(first), JobStatus::Transcribing);

    executor->release();
    EXPECT_EQ(waitTerminal(first)->status, JobStatus::Completed);
}

TEST_F(JobOrchestratorTest, CancelWhileQueuedNeverLoads) {
    executor->holdUntilReleased = true;
    start();

    const JobId first = submit("tiny");
    ASSERT_TRUE(executor->waitForStarted(1));
    const JobId second = submit("base");
    std::this_thread::sleep_for(50ms);

    EXPECT_EQ(orch->cancel(second), CancelOutcome::Accepted);
    auto record = waitTerminal(second);
    ASSERT_TRUE(record);
    EXPECT_EQ(record->status, JobStatus::Canceled);
    EXPECT_EQ(record->errorCode, ErrorCode::Canceled);
    EXPECT_TRUE(record->error.has_value());
    EXPECT_FALSE(record->result.has_value());
    EXPECT_TRUE(record->endedAt.has_value());

    executor->release();
    EXPECT_EQ(waitTerminal(first)->status, JobStatus::Completed);
    EXPECT_EQ(loader->loads(), (std::vector<std::string>{"tiny"}));
    EXPECT_EQ(executor->started(), (std::vector<std::string>{"tiny"}));
}

TEST_F(JobOrchestratorTest, CancelDuringTranscription) {
    executor->holdUntilReleased = true;
    start();

    const JobId id = submit("tiny");
    ASSERT_TRUE(executor->waitForStarted(1));

    EXPECT_EQ(orch->cancel(id), CancelOutcome::Accepted);
    EXPECT_EQ(orch->cancel(id), CancelOutcome::AlreadyCanceling);

    auto record = waitTerminal(id);
    ASSERT_TRUE(record);
    EXPECT_EQ(record->status, JobStatus::Canceled);
    EXPECT_EQ(orch->cancel(id), CancelOutcome::AlreadyTerminal);
    EXPECT_EQ(orch->cancel("unknown"), CancelOutcome::NotFound);

    EXPECT_EQ(orch->gate().inUse(), 0);
    EXPECT_EQ(orch->modelStatus().activeJobs, 0);
}

TEST_F(JobOrchestratorTest, PhaseEventsNeverLeaveCanceling) {
    std::atomic<int> observed{-1};
    executor->script = [&](const WorkRequest& request, ModelLease&, const CancelToken& token, const EventSink& sink) {
        EXPECT_EQ(orch->cancel(request.jobId), CancelOutcome::Accepted);
        EXPECT_TRUE(token.isCanceled());
        sink(PhaseChange{Phase::Transcribing, "still going"});
        sink(PhaseChange{Phase::ModelLoading, "reloading"});
        observed = static_cast<int>(orch->status(request.jobId)->status);

        ExecutionOutcome out;
        out.status = ExecutionStatus::Canceled;
        out.error = ErrorCode::Canceled;
        return out;
    };
    start();

    auto record = waitTerminal(submit("tiny"));
    EXPECT_EQ(observed.load(), static_cast<int>(JobStatus::Canceling));
    EXPECT_EQ(record->status, JobStatus::Canceled);
}

TEST_F(JobOrchestratorTest, LateSuccessAfterCancelResolvesCanceled) {
    executor->script = [&](const WorkRequest& request, ModelLease&, const CancelToken&, const EventSink&) {
        (void)orch->cancel(request.jobId);
        ExecutionOutcome out;
        out.status = ExecutionStatus::Succeeded;
        out.result.text = "too late";
        return out;
    };
    start();

    auto record = waitTerminal(submit("tiny"));
    EXPECT_EQ(record->status, JobStatus::Canceled);
    EXPECT_FALSE(record->result.has_value());
}

TEST_F(JobOrchestratorTest, CancelDuringFinalizationResolvesCanceled) {
    // A non-empty directory at the artifact path makes the cleanup warn,
    // which parks the driver between its token check and the commit.
    executor->script = [&](const WorkRequest& request, ModelLease&, const CancelToken&, const EventSink&) {
        std::filesystem::create_directories(request.outputPath);
        std::ofstream(request.outputPath / "keep") << "x";
        ExecutionOutcome out;
        out.status = ExecutionStatus::Succeeded;
        out.result.text = "done";
        return out;
    };
    start();

    std::atomic<bool> parked{false};
    Logger::setSink([&](const std::string& line) {
        if (line.find("Failed to delete artifact") == std::string::npos || parked.exchange(true)) {
            return;
        }
        eventually([&] {
            for (const auto& record : orch->list()) {
                if (record.status == JobStatus::Canceling) {
                    return true;
                }
            }
            return false;
        }, 2s);
    });

    const JobId id = submit("tiny");
    ASSERT_TRUE(eventually([&] { return parked.load(); }));
    EXPECT_EQ(orch->cancel(id), CancelOutcome::Accepted);

    auto record = waitTerminal(id);
    Logger::setSink({});
    EXPECT_EQ(record->status, JobStatus::Canceled);
    EXPECT_EQ(record->errorCode, ErrorCode::Canceled);
    EXPECT_FALSE(record->result.has_value());
}

TEST_F(JobOrchestratorTest, WorkerDurationDoesNotReplaceProbedValue) {
    executor->script = [&](const WorkRequest& request, ModelLease&, const CancelToken&, const EventSink& sink) {
        sink(DurationInfo{12.0});
        EXPECT_DOUBLE_EQ(orch->status(request.jobId)->audioDuration.value_or(0.0), 12.5);
        ExecutionOutcome out;
        out.status = ExecutionStatus::Succeeded;
        return out;
    };
    start();

    auto record = waitTerminal(submit("tiny"));
    EXPECT_EQ(record->status, JobStatus::Completed);
    EXPECT_DOUBLE_EQ(record->audioDuration.value_or(0.0), 12.5);
}

TEST_F(JobOrchestratorTest, DurationProbeFailure) {
    start(std::nullopt);
    auto record = waitTerminal(submit("tiny"));
    ASSERT_TRUE(record);
    EXPECT_EQ(record->status, JobStatus::Failed);
    EXPECT_EQ(record->errorCode, ErrorCode::DurationProbeFailed);
    EXPECT_TRUE(loader->loads().empty());
    EXPECT_TRUE(executor->started().empty());
}

TEST_F(JobOrchestratorTest, ModelLoadFailure) {
    start();
    auto record = waitTerminal(submit("broken"));
    ASSERT_TRUE(record);
    EXPECT_EQ(record->status, JobStatus::Failed);
    EXPECT_EQ(record->errorCode, ErrorCode::ResourceLoadFailed);
    EXPECT_FALSE(orch->modelStatus().loaded);

    // The slot is usable afterwards.
    EXPECT_EQ(waitTerminal(submit("tiny"))->status, JobStatus::Completed);
}

TEST_F(JobOrchestratorTest, ExecutionFailureCarriesMessage) {
    executor->script = [](const WorkRequest&, ModelLease&, const CancelToken&, const EventSink&) {
        ExecutionOutcome out;
        out.status = ExecutionStatus::Failed;
        out.error = ErrorCode::OutputMissing;
        out.message = "Process completed but output file was not found.";
        return out;
    };
    start();

    auto record = waitTerminal(submit("tiny"));
    ASSERT_TRUE(record);
    EXPECT_EQ(record->status, JobStatus::Failed);
    EXPECT_EQ(record->errorCode, ErrorCode::OutputMissing);
    EXPECT_EQ(record->error.value_or(""), "Process completed but output file was not found.");
    EXPECT_FALSE(record->result.has_value());
}

TEST_F(JobOrchestratorTest, ExecutorExceptionIsUnexpectedInternal) {
    executor->script = [](const WorkRequest&, ModelLease&, const CancelToken&, const EventSink&) -> ExecutionOutcome {
        throw std::logic_error("boom");
    };
    start();

    auto record = waitTerminal(submit("tiny"));
    ASSERT_TRUE(record);
    EXPECT_EQ(record->status, JobStatus::Failed);
    EXPECT_EQ(record->errorCode, ErrorCode::UnexpectedInternal);
    EXPECT_EQ(record->error.value_or(""), "Unexpected internal error");
    EXPECT_EQ(orch->gate().inUse(), 0);
    EXPECT_EQ(orch->modelStatus().activeJobs, 0);
}

TEST_F(JobOrchestratorTest, TemporaryInputAndArtifactRemoved) {
    std::filesystem::path artifact;
    executor->script = [&](const WorkRequest& request, ModelLease&, const CancelToken&, const EventSink&) {
        artifact = request.outputPath;
        std::ofstream(request.outputPath) << "{}";
        ExecutionOutcome out;
        out.status = ExecutionStatus::Succeeded;
        return out;
    };
    start();

    auto temp = audioFile();
    auto kept = audioFile();
    auto a = orch->submit(SubmitRequest{temp, "tiny", true});
    auto b = orch->submit(SubmitRequest{kept, "tiny", false});
    ASSERT_TRUE(a && b);
    waitTerminal(a.id);
    waitTerminal(b.id);

    EXPECT_FALSE(std::filesystem::exists(temp));
    EXPECT_TRUE(std::filesystem::exists(kept));
    EXPECT_FALSE(artifact.empty());
    EXPECT_FALSE(std::filesystem::exists(artifact));
}

TEST_F(JobOrchestratorTest, SweepDropsExpiredRecords) {
    config.jobRetention = 0s;
    start();

    const JobId id = submit("tiny");
    ASSERT_TRUE(waitTerminal(id));
    std::this_thread::sleep_for(20ms);

    EXPECT_EQ(orch->sweep(), 1u);
    EXPECT_FALSE(orch->status(id).has_value());
}

TEST_F(JobOrchestratorTest, UnloadAndStatus) {
    start();
    EXPECT_FALSE(orch->unloadModel());

    ASSERT_EQ(waitTerminal(submit("tiny"))->status, JobStatus::Completed);
    auto status = orch->modelStatus();
    EXPECT_TRUE(status.loaded);
    EXPECT_EQ(status.modelName.value_or(""), "tiny");
    EXPECT_EQ(sibling->calls.load(), 1);

    EXPECT_TRUE(orch->unloadModel());
    EXPECT_FALSE(orch->modelStatus().loaded);
}

TEST_F(JobOrchestratorTest, ShutdownCancelsLiveJobs) {
    executor->holdUntilReleased = true;
    start();

    const JobId running = submit("tiny");
    ASSERT_TRUE(executor->waitForStarted(1));
    const JobId waiting = submit("tiny");

    orch->shutdown();
    EXPECT_EQ(statusOf(running), JobStatus::Canceled);
    EXPECT_EQ(statusOf(waiting), JobStatus::Canceled);
    EXPECT_FALSE(orch->modelStatus().loaded);

    auto late = orch->submit(SubmitRequest{audioFile(), "tiny", false});
    EXPECT_FALSE(late);
}

}
