// =============================================================================
// cidc-upload - Payload Builder Implementation
// =============================================================================

#include "cidc/ingest/payload_builder.h"

#include <algorithm>
#include <iterator>
#include <system_error>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "cidc/common/logger.h"

namespace cidc::ingest {

PayloadBuilder::PayloadBuilder(InputSet nonStaticInputs, const Selections& selections,
                               std::filesystem::path rootDirectory,
                               FileExtensionResolver resolver)
    : nonStaticInputs_(std::move(nonStaticInputs)),
      selections_(selections),
      rootDirectory_(std::move(rootDirectory)),
      resolver_(std::move(resolver)) {}

PairingLabels PayloadBuilder::pairingFor(std::string_view columnKey) noexcept {
    PairingLabels labels;
    if (columnKey == kColFastqNormal1 || columnKey == kColFastqNormal2) {
        labels.tumorNormal = kNormalLabel;
    }
    if (columnKey == kColFastqNormal2 || columnKey == kColFastqTumor2) {
        labels.pairLabel = kPairTwoLabel;
    }
    return labels;
}

std::optional<std::uint64_t> PayloadBuilder::resolveSize(std::string_view fileName) const {
    const auto path = rootDirectory_ / std::filesystem::path(fileName);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        CIDC_LOG_WARNING("File: {} was not found", path.string());
        return std::nullopt;
    }
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        CIDC_LOG_WARNING("Could not read size of {}: {}", path.string(), ec.message());
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(size);
}

BuiltPayload PayloadBuilder::buildRecord(const manifest::ManifestRecord& record) const {
    BuiltPayload payload;
    const std::string sampleId(record.sampleId());

    for (const auto& [key, value] : record.fields()) {
        if (!nonStaticInputs_.contains(key)) {
            continue;
        }

        const PairingLabels labels = pairingFor(key);

        FileSubmission file;
        file.assayId = selections_.assay.id;
        file.assayName = selections_.assay.name;
        file.dataFormat = resolver_.resolve(value);
        file.fileName = value;
        file.fileSize = resolveSize(value);
        file.mapping = key;
        file.sampleIds = {sampleId};
        file.trialId = selections_.trial.id;
        file.trialName = selections_.trial.name;

        file.pairing.patientId = record.valueOr(kColPatientId);
        file.pairing.timepoint = record.valueOr(kColTimepoint);
        file.pairing.timepointUnit = record.valueOr(kColTimepointUnit);
        file.pairing.batchId = record.valueOr(kColBatchId);
        file.pairing.instrumentModel = record.valueOr(kColInstrumentModel);
        file.pairing.readLength = record.valueOr(kColReadLength);
        file.pairing.insertSize = record.valueOr(kColAvgInsertSize);
        file.pairing.sampleId = sampleId;
        file.pairing.tumorNormal = labels.tumorNormal;
        file.pairing.pairLabel = labels.pairLabel;

        payload.fileNames.push_back(value);
        payload.submissions.push_back(std::move(file));
    }

    return payload;
}

BuiltPayload PayloadBuilder::buildAll(const std::vector<manifest::ManifestRecord>& records) const {
    BuiltPayload all;
    for (const auto& record : records) {
        auto next = buildRecord(record);
        std::move(next.submissions.begin(), next.submissions.end(),
                  std::back_inserter(all.submissions));
        std::move(next.fileNames.begin(), next.fileNames.end(), std::back_inserter(all.fileNames));
    }
    CIDC_LOG_DEBUG("Built {} file submissions from {} records", all.submissions.size(),
                   records.size());
    return all;
}

VoidResult PayloadBuilder::checkResolved(const std::vector<FileSubmission>& submissions) {
    std::vector<std::string_view> missing;
    std::vector<std::string_view> unrecognized;
    for (const auto& file : submissions) {
        if (!file.fileSize.has_value()) {
            missing.push_back(file.fileName);
        }
        if (!file.dataFormat.has_value()) {
            unrecognized.push_back(file.fileName);
        }
    }

    if (!missing.empty()) {
        return makeVoidError(ErrorCode::kFileNotFound,
                             fmt::format("One or more files could not be found: {}",
                                         fmt::join(missing, ", ")));
    }
    if (!unrecognized.empty()) {
        return makeVoidError(ErrorCode::kUnsupportedFormat,
                             fmt::format("One or more files have an unrecognized extension: {}",
                                         fmt::join(unrecognized, ", ")));
    }
    return makeVoidSuccess();
}

Result<PreparedBatch> PayloadBuilder::build(
    const std::vector<manifest::ManifestRecord>& records) const {
    auto payload = buildAll(records);

    if (auto resolved = checkResolved(payload.submissions); !resolved) {
        return std::unexpected(resolved.error());
    }

    return PreparedBatch{IngestionBatch{std::move(payload.submissions)},
                         std::move(payload.fileNames)};
}

}  // namespace cidc::ingest
