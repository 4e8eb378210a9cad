// =============================================================================
// cidc-upload - Job Commands
// =============================================================================
// Command handlers for inspecting ingestion jobs:
// - JobsCommand ("cidc jobs [--id]"): list the caller's jobs or show one
// - TrackCommand ("cidc track --id"): poll one job until it is terminal
// =============================================================================

#ifndef CIDC_COMMANDS_JOBS_COMMAND_H
#define CIDC_COMMANDS_JOBS_COMMAND_H

#include <iostream>
#include <string>

#include "cidc/api/ingestion_service.h"
#include "cidc/job/job_status_tracker.h"
#include "command_support.h"

namespace cidc::commands {

class JobsCommand {
public:
    /// @param jobId Show only this job; empty lists all jobs.
    JobsCommand(std::string jobId, ConnectionOptions connection,
                std::ostream& out = std::cout, std::ostream& err = std::cerr);

    [[nodiscard]] int execute();

    [[nodiscard]] int run(api::IngestionService& service);

private:
    std::string jobId_;
    ConnectionOptions connection_;
    std::ostream& out_;
    std::ostream& err_;
};

class TrackCommand {
public:
    TrackCommand(std::string jobId, job::TrackerConfig config, ConnectionOptions connection,
                 std::ostream& out = std::cout, std::ostream& err = std::cerr);

    [[nodiscard]] int execute();

    [[nodiscard]] int run(api::IngestionService& service,
                          job::Sleeper sleeper = job::threadSleeper());

private:
    std::string jobId_;
    job::TrackerConfig config_;
    ConnectionOptions connection_;
    std::ostream& out_;
    std::ostream& err_;
};

}  // namespace cidc::commands

#endif  // CIDC_COMMANDS_JOBS_COMMAND_H
