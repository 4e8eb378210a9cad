// =============================================================================
// cidc-upload - Upload Command Implementation
// =============================================================================

#include "upload_command.h"

#include <fmt/format.h>

#include "cidc/common/logger.h"

namespace cidc::commands {

namespace {

std::string_view stageVerb(pipeline::UploadStage stage) noexcept {
    switch (stage) {
        case pipeline::UploadStage::kResolve:
            return "Looking up";
        case pipeline::UploadStage::kParse:
            return "Reading manifest";
        case pipeline::UploadStage::kValidate:
            return "Checking sample ids of";
        case pipeline::UploadStage::kBuild:
            return "Collecting files in";
        case pipeline::UploadStage::kRegister:
            return "Registering";
        case pipeline::UploadStage::kTransfer:
            return "Copying files to";
        case pipeline::UploadStage::kTrack:
            return "Waiting for job";
    }
    return "";
}

}  // namespace

pipeline::UploadPipelineConfig UploadOptions::toPipelineConfig() const {
    pipeline::UploadPipelineConfig config;
    config.transfer.tool = transferTool;
    config.transfer.parallelThreshold = parallelThreshold;
    config.tracker.pollInterval = pollInterval;
    config.tracker.maxPolls = maxPolls;
    config.waitForCompletion = wait;
    return config;
}

UploadCommand::UploadCommand(UploadOptions options, ConnectionOptions connection,
                             std::ostream& out, std::ostream& err)
    : options_(std::move(options)), connection_(std::move(connection)), out_(out), err_(err) {}

int UploadCommand::execute() {
    auto connection = ApiConnection::open(connection_, Clock::now());
    if (!connection) {
        return reportFailure(connection.error(), "Upload", err_);
    }

    transfer::ProcessCommandRunner runner;
    return run((*connection)->service(), runner, (*connection)->session());
}

int UploadCommand::run(api::IngestionService& service, transfer::CommandRunner& runner,
                       const Session& session, job::Sleeper sleeper) {
    pipeline::UploadPipeline pipeline(service, runner, options_.toPipelineConfig(),
                                      std::move(sleeper));

    pipeline.setStageCallback([this](pipeline::UploadStage stage, std::string_view detail) {
        out_ << stageVerb(stage) << ' ' << detail << '\n';
    });

    const std::size_t maxPolls = options_.maxPolls;
    pipeline.setStatusObserver([this, maxPolls](std::size_t poll, const JobStatus& status) {
        if (!status.isTerminal()) {
            out_ << fmt::format("Upload is still in progress, checking again later ({}/{})\n",
                                poll, maxPolls);
        }
    });

    auto stats = pipeline.run(
        pipeline::UploadRequest{options_.manifestPath, options_.trialId, options_.assayId},
        session);
    if (!stats) {
        return reportFailure(stats.error(), "Upload", err_);
    }
    return report(*stats);
}

int UploadCommand::report(const pipeline::UploadStats& stats) {
    if (!stats.statusRecorded) {
        err_ << fmt::format("Warning: the files were copied but job {} could not be marked "
                            "as completed.\n",
                            stats.ingestionId);
    }

    if (!stats.tracking) {
        out_ << fmt::format(
            "Copied {} files from {} records; job {} is processing. Check it with "
            "'cidc jobs --id {}'.\n",
            stats.fileCount, stats.recordCount, stats.ingestionId, stats.ingestionId);
        return toExitCode(ErrorCode::kSuccess);
    }

    auto outcome = stats.tracking->toResult(stats.ingestionId);
    if (!outcome) {
        return reportFailure(outcome.error(), "Upload", err_);
    }

    out_ << fmt::format("Upload completed: {} files from {} records (job {}).\n",
                        stats.fileCount, stats.recordCount, stats.ingestionId);
    CIDC_LOG_INFO("Upload {} completed after {} status checks", stats.ingestionId,
                  stats.tracking->polls);
    return toExitCode(ErrorCode::kSuccess);
}

}  // namespace cidc::commands
