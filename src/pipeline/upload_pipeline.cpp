// =============================================================================
// cidc-upload - Upload Pipeline Implementation
// =============================================================================

#include "cidc/pipeline/upload_pipeline.h"

#include <algorithm>

#include <fmt/format.h>

#include "cidc/common/logger.h"
#include "cidc/manifest/sample_validator.h"

namespace cidc::pipeline {

UploadPipeline::UploadPipeline(api::IngestionService& service, transfer::CommandRunner& runner,
                               UploadPipelineConfig config, job::Sleeper sleeper)
    : service_(service),
      runner_(runner),
      config_(std::move(config)),
      sleeper_(std::move(sleeper)) {}

void UploadPipeline::enter(UploadStage stage, std::string_view detail) const {
    CIDC_LOG_DEBUG("Stage {}: {}", uploadStageToString(stage), detail);
    if (stageCallback_) {
        stageCallback_(stage, detail);
    }
}

Result<ingest::Selections> UploadPipeline::resolveSelections(const UploadRequest& request,
                                                             const Session& session) {
    enter(UploadStage::kResolve, fmt::format("trial {}, assay {}", request.trialId,
                                             request.assayId));

    auto trial = service_.getTrial(request.trialId);
    if (!trial) {
        return std::unexpected(trial.error());
    }
    auto assay = service_.getAssay(request.assayId);
    if (!assay) {
        return std::unexpected(assay.error());
    }

    if (!trial->assays.empty()) {
        auto registered = std::find_if(
            trial->assays.begin(), trial->assays.end(),
            [&](const AssaySelection& candidate) { return candidate.id == assay->assay.id; });
        if (registered == trial->assays.end()) {
            return makeError<ingest::Selections>(
                ErrorCode::kInvalidArgument,
                fmt::format("Assay {} is not registered for trial {}", request.assayId,
                            trial->trial.name.empty() ? trial->trial.id : trial->trial.name));
        }
        if (assay->assay.name.empty()) {
            assay->assay.name = registered->name;
        }
    }

    CIDC_LOG_INFO("Uploading to trial '{}' ({} known samples), assay '{}'", trial->trial.name,
                  trial->trial.sampleIds.size(), assay->assay.name);

    nonStaticInputs_ = std::move(assay->nonStaticInputs);
    return ingest::Selections{std::move(trial->trial), std::move(assay->assay), session};
}

Result<PreparedUpload> UploadPipeline::prepare(
    const std::filesystem::path& manifestPath, const ingest::Selections& selections,
    const ingest::PayloadBuilder::InputSet& nonStaticInputs) const {
    enter(UploadStage::kParse, manifestPath.string());
    manifest::ManifestParser parser(config_.manifest);
    auto parsed = parser.parseFile(manifestPath);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    if (auto columns = manifest::checkRequiredColumns(*parsed); !columns) {
        return std::unexpected(columns.error());
    }

    enter(UploadStage::kValidate, fmt::format("{} records", parsed->records.size()));
    manifest::SampleValidator validator(selections.trial.sampleIds);
    if (auto known = validator.requireAllKnown(parsed->records); !known) {
        return std::unexpected(known.error());
    }

    std::filesystem::path sourceDirectory = manifestPath.parent_path();
    if (sourceDirectory.empty()) {
        sourceDirectory = ".";
    }

    enter(UploadStage::kBuild, sourceDirectory.string());
    ingest::PayloadBuilder builder(nonStaticInputs, selections, sourceDirectory);
    auto built = builder.build(parsed->records);
    if (!built) {
        return std::unexpected(built.error());
    }

    CIDC_LOG_INFO("Manifest {}: {} records, {} files", manifestPath.string(),
                  parsed->records.size(), built->batch.fileCount());

    return PreparedUpload{std::move(*built), std::move(sourceDirectory),
                          parsed->records.size(), parsed->truncated};
}

Result<UploadStats> UploadPipeline::run(const UploadRequest& request, const Session& session) {
    auto selections = resolveSelections(request, session);
    if (!selections) {
        return std::unexpected(selections.error());
    }

    auto prepared = prepare(request.manifestPath, *selections, nonStaticInputs_);
    if (!prepared) {
        return std::unexpected(prepared.error());
    }

    const auto& batch = prepared->prepared.batch;
    if (batch.fileCount() == 0) {
        return makeError<UploadStats>(
            ErrorCode::kInvalidState,
            fmt::format("Manifest {} does not reference any files for assay {}",
                        request.manifestPath.string(), selections->assay.name));
    }

    enter(UploadStage::kRegister, fmt::format("{} files", batch.fileCount()));
    auto receipt = service_.createIngestion(batch);
    if (!receipt) {
        return std::unexpected(receipt.error());
    }

    transfer::TransferEngine engine(runner_, service_, config_.transfer);
    enter(UploadStage::kTransfer, transfer::TransferEngine::destinationUri(*receipt));
    auto transferred = engine.transfer(prepared->sourceDirectory, *receipt, batch.fileCount());
    if (!transferred) {
        return std::unexpected(transferred.error());
    }

    UploadStats stats;
    stats.recordCount = prepared->recordCount;
    stats.fileCount = batch.fileCount();
    stats.ingestionId = transferred->ingestionId;
    stats.destination = transferred->destination;
    stats.parallelTransfer = engine.useParallel(batch.fileCount());
    stats.statusRecorded = transferred->statusRecorded;

    if (config_.waitForCompletion) {
        enter(UploadStage::kTrack, stats.ingestionId);
        job::JobStatusTracker tracker(service_, config_.tracker, sleeper_);
        stats.tracking = tracker.track(stats.ingestionId, statusObserver_);
    }

    return stats;
}

}  // namespace cidc::pipeline
