// =============================================================================
// cidc-upload - Common Type Definitions
// =============================================================================
// Core type definitions shared by the upload pipeline.
//
// This module defines:
// - Manifest schema constants (column count, line window, column names)
// - JobProgress / JobStatus: the ingestion job state machine values
// - TrialSelection, AssaySelection: the user's chosen trial and assay
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef CIDC_COMMON_TYPES_H
#define CIDC_COMMON_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>

namespace cidc {

// =============================================================================
// Manifest Schema
// =============================================================================

/// @brief Number of columns every upload manifest carries.
inline constexpr std::size_t kManifestColumnCount = 13;

/// @brief Lines of the manifest read to establish its structure.
inline constexpr std::size_t kManifestLineWindow = 500;

inline constexpr std::string_view kColSampleId = "#CIMAC_SAMPLE_ID";
inline constexpr std::string_view kColPatientId = "CIMAC_PATIENT_ID";
inline constexpr std::string_view kColTimepoint = "TIMEPOINT";
inline constexpr std::string_view kColTimepointUnit = "TIMEPOINT_UNIT";
inline constexpr std::string_view kColBatchId = "BATCH_ID";
inline constexpr std::string_view kColInstrumentModel = "INSTRUMENT_MODEL";
inline constexpr std::string_view kColReadLength = "READ_LENGTH";
inline constexpr std::string_view kColAvgInsertSize = "AVG_INSERT_SIZE";

inline constexpr std::string_view kColFastqTumor1 = "FASTQ_TUMOR_1";
inline constexpr std::string_view kColFastqTumor2 = "FASTQ_TUMOR_2";
inline constexpr std::string_view kColFastqNormal1 = "FASTQ_NORMAL_1";
inline constexpr std::string_view kColFastqNormal2 = "FASTQ_NORMAL_2";

/// @brief Metadata columns the payload builder reads from every record.
inline constexpr std::array<std::string_view, 8> kRequiredManifestColumns{
    kColSampleId,  kColPatientId,       kColTimepoint,  kColTimepointUnit,
    kColBatchId,   kColInstrumentModel, kColReadLength, kColAvgInsertSize,
};

// =============================================================================
// Job Status
// =============================================================================

/// @brief Progress states of an ingestion job.
enum class JobProgress : std::uint8_t {
    kInProgress = 0,
    kCompleted = 1,
    kAborted = 2
};

/// @brief Wire representation used by the ingestion API.
[[nodiscard]] constexpr std::string_view jobProgressToString(JobProgress progress) noexcept {
    switch (progress) {
        case JobProgress::kInProgress:
            return "In Progress";
        case JobProgress::kCompleted:
            return "Completed";
        case JobProgress::kAborted:
            return "Aborted";
    }
    return "In Progress";
}

/// @brief Parse the wire representation; nullopt for unknown values.
[[nodiscard]] constexpr std::optional<JobProgress> jobProgressFromString(
    std::string_view str) noexcept {
    if (str == "In Progress" || str == "InProgress") {
        return JobProgress::kInProgress;
    }
    if (str == "Completed") {
        return JobProgress::kCompleted;
    }
    if (str == "Aborted") {
        return JobProgress::kAborted;
    }
    return std::nullopt;
}

/// @brief Status of an ingestion job; message is set only when aborted.
struct JobStatus {
    JobProgress progress = JobProgress::kInProgress;
    std::string message;

    [[nodiscard]] static JobStatus inProgress() { return JobStatus{}; }

    [[nodiscard]] static JobStatus completed() {
        return JobStatus{JobProgress::kCompleted, {}};
    }

    [[nodiscard]] static JobStatus aborted(std::string message) {
        return JobStatus{JobProgress::kAborted, std::move(message)};
    }

    [[nodiscard]] bool isTerminal() const noexcept {
        return progress != JobProgress::kInProgress;
    }

    bool operator==(const JobStatus&) const = default;
};

// =============================================================================
// Trial / Assay Selection
// =============================================================================

/// @brief Trial chosen for an upload.
struct TrialSelection {
    std::string id;
    std::string name;

    /// @brief Sample ids registered for the trial.
    std::set<std::string, std::less<>> sampleIds;
};

/// @brief Assay chosen for an upload.
struct AssaySelection {
    std::string id;
    std::string name;
};

}  // namespace cidc

#endif  // CIDC_COMMON_TYPES_H
