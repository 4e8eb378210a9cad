// =============================================================================
// cidc-upload - Job Commands Implementation
// =============================================================================

#include "jobs_command.h"

#include <fmt/format.h>

#include "cidc/common/logger.h"

namespace cidc::commands {

// =============================================================================
// JobsCommand
// =============================================================================

JobsCommand::JobsCommand(std::string jobId, ConnectionOptions connection, std::ostream& out,
                         std::ostream& err)
    : jobId_(std::move(jobId)), connection_(std::move(connection)), out_(out), err_(err) {}

int JobsCommand::execute() {
    auto connection = ApiConnection::open(connection_, Clock::now());
    if (!connection) {
        return reportFailure(connection.error(), "Job lookup", err_);
    }
    return run((*connection)->service());
}

int JobsCommand::run(api::IngestionService& service) {
    if (!jobId_.empty()) {
        auto status = service.getIngestionStatus(jobId_);
        if (!status) {
            return reportFailure(status.error(), "Job lookup", err_);
        }
        out_ << fmt::format("Job {} is {}.\n", jobId_, describeStatus(*status));
        return toExitCode(ErrorCode::kSuccess);
    }

    auto jobs = service.listJobs();
    if (!jobs) {
        return reportFailure(jobs.error(), "Job listing", err_);
    }
    if (jobs->empty()) {
        out_ << "You have no upload jobs.\n";
        return toExitCode(ErrorCode::kSuccess);
    }

    for (const auto& job : *jobs) {
        out_ << fmt::format("{:<26} {:<28} {}\n", job.id, job.startTime,
                            describeStatus(job.status));
    }
    CIDC_LOG_DEBUG("Listed {} jobs", jobs->size());
    return toExitCode(ErrorCode::kSuccess);
}

// =============================================================================
// TrackCommand
// =============================================================================

TrackCommand::TrackCommand(std::string jobId, job::TrackerConfig config,
                           ConnectionOptions connection, std::ostream& out, std::ostream& err)
    : jobId_(std::move(jobId)),
      config_(config),
      connection_(std::move(connection)),
      out_(out),
      err_(err) {}

int TrackCommand::execute() {
    auto connection = ApiConnection::open(connection_, Clock::now());
    if (!connection) {
        return reportFailure(connection.error(), "Tracking", err_);
    }
    return run((*connection)->service());
}

int TrackCommand::run(api::IngestionService& service, job::Sleeper sleeper) {
    job::JobStatusTracker tracker(service, config_, std::move(sleeper));

    const auto result =
        tracker.track(jobId_, [this](std::size_t poll, const JobStatus& status) {
            if (!status.isTerminal()) {
                out_ << fmt::format("Job {} is still in progress ({}/{})\n", jobId_, poll,
                                    config_.maxPolls);
            }
        });

    if (auto outcome = result.toResult(jobId_); !outcome) {
        return reportFailure(outcome.error(), "Tracking", err_);
    }
    out_ << fmt::format("Job {} completed.\n", jobId_);
    return toExitCode(ErrorCode::kSuccess);
}

}  // namespace cidc::commands
