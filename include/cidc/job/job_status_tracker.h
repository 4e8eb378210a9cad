// =============================================================================
// cidc-upload - Job Status Tracker
// =============================================================================
// Polls the ingestion API until a job reaches a terminal state or the poll
// budget is exhausted.
//
// Outcomes:
// - kCompleted: the backend reported Completed
// - kAborted:   the backend reported Aborted (message carried through)
// - kTimedOut:  maxPolls observations without a terminal state
//
// A failed poll counts against the budget, is logged, and polling continues.
// The tracker sleeps between polls but not after the last one.
// =============================================================================

#ifndef CIDC_JOB_JOB_STATUS_TRACKER_H
#define CIDC_JOB_JOB_STATUS_TRACKER_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "cidc/api/ingestion_service.h"
#include "cidc/common/error.h"
#include "cidc/common/types.h"

namespace cidc::job {

inline constexpr std::chrono::seconds kDefaultPollInterval{30};
inline constexpr std::size_t kDefaultMaxPolls = 200;

struct TrackerConfig {
    std::chrono::seconds pollInterval = kDefaultPollInterval;
    std::size_t maxPolls = kDefaultMaxPolls;
};

enum class TrackOutcome : std::uint8_t { kCompleted, kAborted, kTimedOut };

[[nodiscard]] constexpr std::string_view trackOutcomeToString(TrackOutcome outcome) noexcept {
    switch (outcome) {
        case TrackOutcome::kCompleted:
            return "completed";
        case TrackOutcome::kAborted:
            return "aborted";
        case TrackOutcome::kTimedOut:
            return "timed out";
    }
    return "timed out";
}

struct TrackResult {
    TrackOutcome outcome = TrackOutcome::kTimedOut;

    /// @brief Number of status requests issued, failed ones included.
    std::size_t polls = 0;

    /// @brief Polls whose request failed.
    std::size_t failedPolls = 0;

    /// @brief Backend message for kAborted.
    std::string message;

    /// @brief kSuccess for kCompleted, else kJobAborted / kJobTimedOut.
    [[nodiscard]] VoidResult toResult(std::string_view jobId) const;
};

/// @brief Suspends the calling thread; replaced in tests.
using Sleeper = std::function<void(std::chrono::seconds)>;

/// @brief Called after each successful poll with the 1-based poll number.
using StatusObserver = std::function<void(std::size_t, const JobStatus&)>;

/// @brief Sleeper backed by std::this_thread::sleep_for.
[[nodiscard]] Sleeper threadSleeper();

class JobStatusTracker {
public:
    JobStatusTracker(api::IngestionService& service, TrackerConfig config = {},
                     Sleeper sleeper = threadSleeper());

    /// @brief Poll the job until it is terminal or the budget runs out.
    [[nodiscard]] TrackResult track(const std::string& jobId,
                                    const StatusObserver& observer = {}) const;

    [[nodiscard]] const TrackerConfig& config() const noexcept { return config_; }

private:
    api::IngestionService& service_;
    TrackerConfig config_;
    Sleeper sleeper_;
};

}  // namespace cidc::job

#endif  // CIDC_JOB_JOB_STATUS_TRACKER_H
