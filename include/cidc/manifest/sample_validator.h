// =============================================================================
// cidc-upload - Sample Validator
// =============================================================================
// Checks manifest sample ids against the sample ids registered for a trial.
//
// Validation is all-or-nothing: every record is checked before any payload
// is built, and a single unknown id rejects the whole batch.
// =============================================================================

#ifndef CIDC_MANIFEST_SAMPLE_VALIDATOR_H
#define CIDC_MANIFEST_SAMPLE_VALIDATOR_H

#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "cidc/common/error.h"
#include "cidc/manifest/manifest_parser.h"

namespace cidc::manifest {

/// @brief Outcome of checking every record of a manifest.
struct SampleValidationReport {
    /// @brief Number of records checked.
    std::size_t checked = 0;

    /// @brief Unknown sample ids in first-seen order, without duplicates.
    std::vector<std::string> unknownIds;

    [[nodiscard]] bool allKnown() const noexcept { return unknownIds.empty(); }
};

/// @brief Membership check of sample ids against a trial's sample set.
class SampleValidator {
public:
    using SampleSet = std::set<std::string, std::less<>>;

    /// @param knownIds Sample ids of the selected trial; must outlive the validator.
    explicit SampleValidator(const SampleSet& knownIds) : knownIds_(knownIds) {}

    [[nodiscard]] bool isKnown(std::string_view sampleId) const {
        return knownIds_.contains(sampleId);
    }

    /// @brief Check every record and collect the unknown ids.
    [[nodiscard]] SampleValidationReport validateAll(
        const std::vector<ManifestRecord>& records) const;

    /// @brief Check every record; kSampleId error if any id is unknown.
    [[nodiscard]] VoidResult requireAllKnown(const std::vector<ManifestRecord>& records) const;

private:
    const SampleSet& knownIds_;
};

}  // namespace cidc::manifest

#endif  // CIDC_MANIFEST_SAMPLE_VALIDATOR_H
