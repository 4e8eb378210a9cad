// =============================================================================
// cidc-upload - Submission Model
// =============================================================================
// Payload types sent to and received from the ingestion API.
//
// This module defines:
// - PairingInfo: sequencing metadata and tumor/normal, pair classification
// - FileSubmission: one descriptor per physical file
// - IngestionBatch: the immutable payload for one upload run
// - IngestionReceipt: backend-assigned identity of an accepted batch
// - StatusUpdate: the single status patch the client issues per batch
// =============================================================================

#ifndef CIDC_INGEST_SUBMISSION_H
#define CIDC_INGEST_SUBMISSION_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "cidc/common/session.h"
#include "cidc/common/types.h"

namespace cidc::ingest {

inline constexpr std::string_view kTumorLabel = "TUMOR";
inline constexpr std::string_view kNormalLabel = "NORMAL";
inline constexpr std::string_view kPairOneLabel = "PAIR 1";
inline constexpr std::string_view kPairTwoLabel = "PAIR 2";

/// @brief Sequencing metadata attached to each file.
struct PairingInfo {
    std::string patientId;
    std::string timepoint;
    std::string timepointUnit;
    std::string batchId;
    std::string instrumentModel;
    std::string readLength;
    std::string insertSize;
    std::string sampleId;

    /// @brief "TUMOR" or "NORMAL".
    std::string tumorNormal{kTumorLabel};

    /// @brief "PAIR 1" or "PAIR 2".
    std::string pairLabel{kPairOneLabel};

    bool operator==(const PairingInfo&) const = default;
};

/// @brief One file of a batch.
struct FileSubmission {
    std::string assayId;
    std::string assayName;

    /// @brief Data-format label; nullopt when the extension is unrecognized.
    std::optional<std::string> dataFormat;

    std::string fileName;

    /// @brief Size in bytes; nullopt when the file was not found.
    std::optional<std::uint64_t> fileSize;

    /// @brief Manifest column the file name came from.
    std::string mapping;

    std::vector<std::string> sampleIds;
    std::string trialId;
    std::string trialName;
    PairingInfo pairing;

    [[nodiscard]] std::size_t numberOfSamples() const noexcept { return sampleIds.size(); }
};

/// @brief Payload registered with the backend for one upload run.
class IngestionBatch {
public:
    explicit IngestionBatch(std::vector<FileSubmission> files) : files_(std::move(files)) {}

    [[nodiscard]] std::size_t fileCount() const noexcept { return files_.size(); }

    /// @brief Status the batch is created with.
    [[nodiscard]] const JobStatus& status() const noexcept { return status_; }

    [[nodiscard]] const std::vector<FileSubmission>& files() const noexcept { return files_; }

private:
    std::vector<FileSubmission> files_;
    JobStatus status_ = JobStatus::inProgress();
};

/// @brief Identity assigned by the backend to an accepted batch.
struct IngestionReceipt {
    /// @brief Record id (_id).
    std::string id;

    /// @brief Concurrency tag (_etag) required by PATCH via If-Match.
    std::string etag;

    /// @brief Storage folder path from the google_folder_path header.
    std::string googleFolderPath;

    /// @brief Storage base URL from the google_url header (may be empty).
    std::string googleUrl;
};

/// @brief Status patch applied to a batch after the transfer.
struct StatusUpdate {
    JobStatus status;

    /// @brief ISO-8601 completion time, only for Completed.
    std::optional<std::string> endTime;

    [[nodiscard]] static StatusUpdate completed(Clock::time_point now);

    [[nodiscard]] static StatusUpdate aborted(std::string message);
};

/// @brief Format a time point as ISO-8601 UTC with microseconds.
[[nodiscard]] std::string toIsoTimestamp(Clock::time_point tp);

}  // namespace cidc::ingest

#endif  // CIDC_INGEST_SUBMISSION_H
