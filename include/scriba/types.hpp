#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace scriba {

// Job lifecycle states. Completed, Failed and Canceled are terminal.
enum class JobStatus : std::uint8_t {
    Queued,
    ModelLoading,
    ModelDownloading,
    Transcribing,
    Canceling,
    Completed,
    Failed,
    Canceled
};

enum class ErrorCode : std::uint8_t {
    None = 0,
    InvalidInput,
    DurationProbeFailed,
    ResourceBusy,
    ResourceLoadFailed,
    ExecutionFailed,
    OutputMissing,
    Canceled,
    UnexpectedInternal
};

// Opaque job identifier.
using JobId = std::string;

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

struct Segment {
    double start = 0.0;
    double end = 0.0;
    std::string text;
};

struct TranscriptionResult {
    std::string text;
    std::vector<Segment> segments;
    std::string language;
};

struct JobRecord {
    JobId id;
    JobStatus status = JobStatus::Queued;
    double progress = 0.0;
    std::optional<double> audioDuration;
    std::optional<TranscriptionResult> result;
    std::optional<std::string> error;
    ErrorCode errorCode = ErrorCode::None;
    std::optional<std::string> message;
    std::string modelName;
    std::optional<std::string> device;
    TimePoint submittedAt{};
    std::optional<TimePoint> startedAt;
    std::optional<TimePoint> endedAt;
};

[[nodiscard]] constexpr bool isTerminal(JobStatus status) noexcept {
    return status == JobStatus::Completed || status == JobStatus::Failed ||
           status == JobStatus::Canceled;
}

[[nodiscard]] const char* toString(JobStatus status) noexcept;
[[nodiscard]] const char* toString(ErrorCode code) noexcept;

} // namespace scriba
