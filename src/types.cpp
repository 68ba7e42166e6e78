#include "scriba/types.hpp"

namespace scriba {

const char* toString(JobStatus status) noexcept {
    switch (status) {
        case JobStatus::Queued: return "queued";
        case JobStatus::ModelLoading: return "model_loading";
        case JobStatus::ModelDownloading: return "model_downloading";
        case JobStatus::Transcribing: return "transcribing";
        case JobStatus::Canceling: return "canceling";
        case JobStatus::Completed: return "completed";
        case JobStatus::Failed: return "failed";
        case JobStatus::Canceled: return "canceled";
        default: return "unknown";
    }
}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::InvalidInput: return "invalid_input";
        case ErrorCode::DurationProbeFailed: return "duration_probe_failed";
        case ErrorCode::ResourceBusy: return "resource_busy";
        case ErrorCode::ResourceLoadFailed: return "resource_load_failed";
        case ErrorCode::ExecutionFailed: return "execution_failed";
        case ErrorCode::OutputMissing: return "output_missing";
        case ErrorCode::Canceled: return "canceled";
        case ErrorCode::UnexpectedInternal: return "unexpected_internal";
        default: return "unknown";
    }
}

} // namespace scriba
