// =============================================================================
// cidc-upload - Job Status Tracker Implementation
// =============================================================================

#include "cidc/job/job_status_tracker.h"

#include <thread>

#include <fmt/format.h>

#include "cidc/common/logger.h"

namespace cidc::job {

VoidResult TrackResult::toResult(std::string_view jobId) const {
    switch (outcome) {
        case TrackOutcome::kCompleted:
            return makeVoidSuccess();
        case TrackOutcome::kAborted:
            return makeVoidError(ErrorCode::kJobAborted,
                                 fmt::format("Ingestion {} was aborted: {}", jobId,
                                             message.empty() ? "no reason given" : message));
        case TrackOutcome::kTimedOut:
            break;
    }
    return makeVoidError(ErrorCode::kJobTimedOut,
                         fmt::format("Ingestion {} did not finish after {} status checks", jobId,
                                     polls));
}

Sleeper threadSleeper() {
    return [](std::chrono::seconds duration) { std::this_thread::sleep_for(duration); };
}

JobStatusTracker::JobStatusTracker(api::IngestionService& service, TrackerConfig config,
                                   Sleeper sleeper)
    : service_(service), config_(config), sleeper_(std::move(sleeper)) {}

TrackResult JobStatusTracker::track(const std::string& jobId,
                                    const StatusObserver& observer) const {
    TrackResult result;

    for (std::size_t poll = 1; poll <= config_.maxPolls; ++poll) {
        if (poll > 1) {
            sleeper_(config_.pollInterval);
        }
        result.polls = poll;

        auto status = service_.getIngestionStatus(jobId);
        if (!status) {
            ++result.failedPolls;
            CIDC_LOG_WARNING("Status check {} for ingestion {} failed: {}", poll, jobId,
                             status.error().message());
            continue;
        }

        if (observer) {
            observer(poll, *status);
        }

        switch (status->progress) {
            case JobProgress::kCompleted:
                CIDC_LOG_INFO("Ingestion {} completed after {} status checks", jobId, poll);
                result.outcome = TrackOutcome::kCompleted;
                return result;
            case JobProgress::kAborted:
                CIDC_LOG_ERROR("Ingestion {} aborted: {}", jobId, status->message);
                result.outcome = TrackOutcome::kAborted;
                result.message = status->message;
                return result;
            case JobProgress::kInProgress:
                CIDC_LOG_DEBUG("Ingestion {} still in progress (check {}/{})", jobId, poll,
                               config_.maxPolls);
                break;
        }
    }

    CIDC_LOG_WARNING("Gave up on ingestion {} after {} status checks", jobId, result.polls);
    result.outcome = TrackOutcome::kTimedOut;
    return result;
}

}  // namespace cidc::job
