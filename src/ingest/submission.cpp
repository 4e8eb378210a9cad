// =============================================================================
// cidc-upload - Submission Model Implementation
// =============================================================================

#include "cidc/ingest/submission.h"

#include <chrono>
#include <ctime>

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace cidc::ingest {

std::string toIsoTimestamp(Clock::time_point tp) {
    const auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    const auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(tp - secs).count();
    const std::time_t seconds = Clock::to_time_t(secs);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:06d}Z", utc, micros);
}

StatusUpdate StatusUpdate::completed(Clock::time_point now) {
    return StatusUpdate{JobStatus::completed(), toIsoTimestamp(now)};
}

StatusUpdate StatusUpdate::aborted(std::string message) {
    return StatusUpdate{JobStatus::aborted(std::move(message)), std::nullopt};
}

}  // namespace cidc::ingest
