// =============================================================================
// cidc-upload - JSON Codec
// =============================================================================
// Conversion between the submission model and the ingestion API's JSON
// documents.
//
// Outbound:
// - FileSubmission  -> one element of "files"
// - IngestionBatch  -> {number_of_files, status, files}
// - StatusUpdate    -> {status: {progress, message}[, end_time]}
//
// Inbound:
// - {progress, message}                       -> JobStatus
// - {_id, _etag}                              -> IngestionReceipt (ids only)
// - {_id, trial_name, samples, assays}        -> TrialInfo
// - {assay_id, assay_name, non_static_inputs} -> AssayInfo
//
// Decoding never throws; malformed documents yield kTransportError.
// =============================================================================

#ifndef CIDC_API_JSON_CODEC_H
#define CIDC_API_JSON_CODEC_H

#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "cidc/common/error.h"
#include "cidc/common/types.h"
#include "cidc/ingest/submission.h"

namespace cidc::api {

/// @brief A trial as returned by the API, with the assays registered for it.
struct TrialInfo {
    TrialSelection trial;
    std::vector<AssaySelection> assays;
};

/// @brief An assay as returned by the API.
struct AssayInfo {
    AssaySelection assay;

    /// @brief Manifest columns whose values are file names.
    std::set<std::string, std::less<>> nonStaticInputs;
};

/// @brief One entry of the caller's job list.
struct JobSummary {
    std::string id;
    JobStatus status;
    std::string startTime;
};

// -----------------------------------------------------------------------------
// Encoding
// -----------------------------------------------------------------------------

[[nodiscard]] nlohmann::json toJson(const JobStatus& status);
[[nodiscard]] nlohmann::json toJson(const ingest::FileSubmission& file);
[[nodiscard]] nlohmann::json toJson(const ingest::IngestionBatch& batch);
[[nodiscard]] nlohmann::json toJson(const ingest::StatusUpdate& update);

// -----------------------------------------------------------------------------
// Decoding
// -----------------------------------------------------------------------------

/// @brief Parse a response body.
[[nodiscard]] Result<nlohmann::json> parseBody(const std::string& body);

/// @brief Decode a status object; a missing message decodes as empty.
[[nodiscard]] Result<JobStatus> jobStatusFromJson(const nlohmann::json& json);

/// @brief Decode the _id and _etag of a created ingestion record.
[[nodiscard]] Result<ingest::IngestionReceipt> receiptFromJson(const nlohmann::json& json);

[[nodiscard]] Result<TrialInfo> trialFromJson(const nlohmann::json& json);

/// @param requestedId Used when the document does not echo assay_id.
[[nodiscard]] Result<AssayInfo> assayFromJson(const nlohmann::json& json,
                                              const std::string& requestedId);

/// @brief Decode an Eve-style collection: {"_items": [...]}.
[[nodiscard]] Result<std::vector<JobSummary>> jobListFromJson(const nlohmann::json& json);

}  // namespace cidc::api

#endif  // CIDC_API_JSON_CODEC_H
