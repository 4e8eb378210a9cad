// =============================================================================
// cidc-upload - Upload Pipeline
// =============================================================================
// Orchestrates one upload run, strictly in order:
//
// 1. Resolve  - fetch the trial (sample ids, assays) and the assay's
//               non-static inputs
// 2. Parse    - read the manifest and check its required columns
// 3. Validate - every sample id must belong to the trial
// 4. Build    - expand records into file submissions; every file must exist
//               and have a recognized extension
// 5. Register - create the ingestion record
// 6. Transfer - copy the manifest directory to storage and record the outcome
// 7. Track    - poll the job until it is terminal (optional)
//
// Steps 2-4 are local and all-or-nothing: if any record fails, nothing is
// registered with the backend.
//
// Usage:
// @code
// UploadPipeline pipeline(service, runner, config);
// auto stats = pipeline.run({"run1/manifest.csv", "trial-1", "assay-1"}, session);
// @endcode
// =============================================================================

#ifndef CIDC_PIPELINE_UPLOAD_PIPELINE_H
#define CIDC_PIPELINE_UPLOAD_PIPELINE_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "cidc/api/ingestion_service.h"
#include "cidc/common/error.h"
#include "cidc/common/session.h"
#include "cidc/ingest/payload_builder.h"
#include "cidc/job/job_status_tracker.h"
#include "cidc/manifest/manifest_parser.h"
#include "cidc/transfer/command_runner.h"
#include "cidc/transfer/transfer_engine.h"

namespace cidc::pipeline {

// =============================================================================
// Stages
// =============================================================================

enum class UploadStage : std::uint8_t {
    kResolve,
    kParse,
    kValidate,
    kBuild,
    kRegister,
    kTransfer,
    kTrack
};

[[nodiscard]] constexpr std::string_view uploadStageToString(UploadStage stage) noexcept {
    switch (stage) {
        case UploadStage::kResolve:
            return "resolve";
        case UploadStage::kParse:
            return "parse";
        case UploadStage::kValidate:
            return "validate";
        case UploadStage::kBuild:
            return "build";
        case UploadStage::kRegister:
            return "register";
        case UploadStage::kTransfer:
            return "transfer";
        case UploadStage::kTrack:
            return "track";
    }
    return "unknown";
}

/// @brief Called when a stage starts, with a short description.
using StageCallback = std::function<void(UploadStage stage, std::string_view detail)>;

// =============================================================================
// Configuration
// =============================================================================

struct UploadPipelineConfig {
    manifest::ManifestParserOptions manifest;
    transfer::TransferConfig transfer;
    job::TrackerConfig tracker;

    /// @brief Poll the job after the transfer.
    bool waitForCompletion = true;
};

struct UploadRequest {
    std::filesystem::path manifestPath;
    std::string trialId;
    std::string assayId;
};

/// @brief Result of the local stages.
struct PreparedUpload {
    ingest::PreparedBatch prepared;

    /// @brief Directory copied to storage (the manifest's directory).
    std::filesystem::path sourceDirectory;

    std::size_t recordCount = 0;

    /// @brief True if lines past the manifest window were ignored.
    bool manifestTruncated = false;
};

/// @brief Summary of a run that reached the transfer stage successfully.
struct UploadStats {
    std::size_t recordCount = 0;
    std::size_t fileCount = 0;
    std::string ingestionId;
    std::string destination;
    bool parallelTransfer = false;

    /// @brief False if the Completed status could not be recorded.
    bool statusRecorded = true;

    /// @brief Present when the job was tracked.
    std::optional<job::TrackResult> tracking;
};

// =============================================================================
// UploadPipeline
// =============================================================================

class UploadPipeline {
public:
    UploadPipeline(api::IngestionService& service, transfer::CommandRunner& runner,
                   UploadPipelineConfig config = {},
                   job::Sleeper sleeper = job::threadSleeper());

    /// @brief Look up the trial and assay; the assay must belong to the trial
    ///        when the trial lists its assays.
    [[nodiscard]] Result<ingest::Selections> resolveSelections(const UploadRequest& request,
                                                               const Session& session);

    /// @brief Parse, validate and build without any network access.
    [[nodiscard]] Result<PreparedUpload> prepare(
        const std::filesystem::path& manifestPath, const ingest::Selections& selections,
        const ingest::PayloadBuilder::InputSet& nonStaticInputs) const;

    /// @brief Run every stage.
    /// @return Stats once the transfer succeeded; a tracked job that aborted or
    ///         timed out is reported through UploadStats::tracking.
    [[nodiscard]] Result<UploadStats> run(const UploadRequest& request, const Session& session);

    void setStageCallback(StageCallback callback) { stageCallback_ = std::move(callback); }

    void setStatusObserver(job::StatusObserver observer) { statusObserver_ = std::move(observer); }

    [[nodiscard]] const UploadPipelineConfig& config() const noexcept { return config_; }

private:
    void enter(UploadStage stage, std::string_view detail) const;

    api::IngestionService& service_;
    transfer::CommandRunner& runner_;
    UploadPipelineConfig config_;
    job::Sleeper sleeper_;
    StageCallback stageCallback_;
    job::StatusObserver statusObserver_;

    /// @brief Non-static inputs of the assay resolved by the last resolveSelections().
    ingest::PayloadBuilder::InputSet nonStaticInputs_;
};

}  // namespace cidc::pipeline

#endif  // CIDC_PIPELINE_UPLOAD_PIPELINE_H
