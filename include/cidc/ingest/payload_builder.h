// =============================================================================
// cidc-upload - Payload Builder
// =============================================================================
// Expands validated manifest records into FileSubmission descriptors.
//
// For every record, each column named in the assay's non-static inputs becomes
// one FileSubmission: its value is a file name relative to the manifest's
// directory. File sizes and data formats are resolved here; missing files and
// unknown extensions are recorded as nullopt so that every problem in the
// batch is reported before the batch is rejected.
//
// Pairing policy (two independent flags):
// - tumor/normal is "NORMAL" for FASTQ_NORMAL_1/FASTQ_NORMAL_2, else "TUMOR"
// - pair label is "PAIR 2" for FASTQ_NORMAL_2/FASTQ_TUMOR_2, else "PAIR 1"
// =============================================================================

#ifndef CIDC_INGEST_PAYLOAD_BUILDER_H
#define CIDC_INGEST_PAYLOAD_BUILDER_H

#include <filesystem>
#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "cidc/common/error.h"
#include "cidc/common/session.h"
#include "cidc/common/types.h"
#include "cidc/ingest/file_extension.h"
#include "cidc/ingest/submission.h"
#include "cidc/manifest/manifest_parser.h"

namespace cidc::ingest {

/// @brief The user's chosen trial and assay plus the session used to fetch them.
struct Selections {
    TrialSelection trial;
    AssaySelection assay;
    Session session;
};

/// @brief Tumor/normal and read-pair classification of one manifest column.
struct PairingLabels {
    std::string_view tumorNormal = kTumorLabel;
    std::string_view pairLabel = kPairOneLabel;

    bool operator==(const PairingLabels&) const = default;
};

/// @brief Submissions produced for one or more records.
struct BuiltPayload {
    std::vector<FileSubmission> submissions;

    /// @brief Raw file names referenced, in submission order.
    std::vector<std::string> fileNames;
};

/// @brief A batch that passed every pre-submission check.
struct PreparedBatch {
    IngestionBatch batch;
    std::vector<std::string> fileNames;
};

class PayloadBuilder {
public:
    using InputSet = std::set<std::string, std::less<>>;

    /// @param nonStaticInputs Manifest columns holding file names.
    /// @param selections Trial and assay the files are registered under.
    /// @param rootDirectory Directory the manifest's file names are relative to.
    PayloadBuilder(InputSet nonStaticInputs, const Selections& selections,
                   std::filesystem::path rootDirectory,
                   FileExtensionResolver resolver = FileExtensionResolver{});

    /// @brief Classify a manifest column.
    [[nodiscard]] static PairingLabels pairingFor(std::string_view columnKey) noexcept;

    /// @brief Expand one record; zero entries when no column is a file input.
    [[nodiscard]] BuiltPayload buildRecord(const manifest::ManifestRecord& record) const;

    /// @brief Expand every record, in order.
    [[nodiscard]] BuiltPayload buildAll(const std::vector<manifest::ManifestRecord>& records) const;

    /// @brief Reject a payload containing unresolved sizes or formats.
    /// @return kFileNotFound if any size is missing, else kUnsupportedFormat if
    ///         any format is missing.
    [[nodiscard]] static VoidResult checkResolved(const std::vector<FileSubmission>& submissions);

    /// @brief buildAll() followed by checkResolved(); all-or-nothing.
    [[nodiscard]] Result<PreparedBatch> build(
        const std::vector<manifest::ManifestRecord>& records) const;

    [[nodiscard]] const std::filesystem::path& rootDirectory() const noexcept {
        return rootDirectory_;
    }

private:
    [[nodiscard]] std::optional<std::uint64_t> resolveSize(std::string_view fileName) const;

    InputSet nonStaticInputs_;
    const Selections& selections_;
    std::filesystem::path rootDirectory_;
    FileExtensionResolver resolver_;
};

}  // namespace cidc::ingest

#endif  // CIDC_INGEST_PAYLOAD_BUILDER_H
