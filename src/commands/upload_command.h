// =============================================================================
// cidc-upload - Upload Command
// =============================================================================
// Command handler for "cidc upload": runs the UploadPipeline and reports each
// stage and the final outcome in plain language.
// =============================================================================

#ifndef CIDC_COMMANDS_UPLOAD_COMMAND_H
#define CIDC_COMMANDS_UPLOAD_COMMAND_H

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <iostream>
#include <string>

#include "cidc/api/ingestion_service.h"
#include "cidc/common/session.h"
#include "cidc/job/job_status_tracker.h"
#include "cidc/pipeline/upload_pipeline.h"
#include "cidc/transfer/command_runner.h"
#include "cidc/transfer/transfer_engine.h"
#include "command_support.h"

namespace cidc::commands {

// =============================================================================
// Upload Options
// =============================================================================

struct UploadOptions {
    /// @brief Manifest file; its directory is what gets copied.
    std::filesystem::path manifestPath;

    std::string trialId;
    std::string assayId;

    /// @brief File count above which the transfer runs in parallel mode.
    std::size_t parallelThreshold = transfer::kDefaultParallelThreshold;

    std::string transferTool{transfer::kDefaultTransferTool};

    std::chrono::seconds pollInterval = job::kDefaultPollInterval;
    std::size_t maxPolls = job::kDefaultMaxPolls;

    /// @brief Track the job after the transfer.
    bool wait = true;

    [[nodiscard]] pipeline::UploadPipelineConfig toPipelineConfig() const;
};

// =============================================================================
// UploadCommand Class
// =============================================================================

class UploadCommand {
public:
    UploadCommand(UploadOptions options, ConnectionOptions connection,
                  std::ostream& out = std::cout, std::ostream& err = std::cerr);

    /// @brief Connect to the API and run the upload.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    /// @brief Run the upload against the given collaborators.
    [[nodiscard]] int run(api::IngestionService& service, transfer::CommandRunner& runner,
                          const Session& session, job::Sleeper sleeper = job::threadSleeper());

    [[nodiscard]] const UploadOptions& options() const noexcept { return options_; }

private:
    /// @brief Print the outcome; returns the exit code.
    int report(const pipeline::UploadStats& stats);

    UploadOptions options_;
    ConnectionOptions connection_;
    std::ostream& out_;
    std::ostream& err_;
};

}  // namespace cidc::commands

#endif  // CIDC_COMMANDS_UPLOAD_COMMAND_H
