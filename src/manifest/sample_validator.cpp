// =============================================================================
// cidc-upload - Sample Validator Implementation
// =============================================================================

#include "cidc/manifest/sample_validator.h"

#include <algorithm>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "cidc/common/logger.h"

namespace cidc::manifest {

SampleValidationReport SampleValidator::validateAll(
    const std::vector<ManifestRecord>& records) const {
    SampleValidationReport report;
    for (const auto& record : records) {
        ++report.checked;
        std::string_view sampleId = record.sampleId();
        if (isKnown(sampleId)) {
            continue;
        }
        CIDC_LOG_WARNING("Sample id '{}' is not a valid sample id for this trial", sampleId);
        if (std::find(report.unknownIds.begin(), report.unknownIds.end(), sampleId) ==
            report.unknownIds.end()) {
            report.unknownIds.emplace_back(sampleId);
        }
    }
    return report;
}

VoidResult SampleValidator::requireAllKnown(const std::vector<ManifestRecord>& records) const {
    auto report = validateAll(records);
    if (report.allKnown()) {
        CIDC_LOG_DEBUG("All {} sample ids recognized", report.checked);
        return makeVoidSuccess();
    }
    return makeVoidError(
        ErrorCode::kSampleId,
        fmt::format("One or more sample ids were not recognized as valid ids for this trial: {}",
                    fmt::join(report.unknownIds, ", ")));
}

}  // namespace cidc::manifest
