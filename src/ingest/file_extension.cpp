// =============================================================================
// cidc-upload - File Extension Resolver Implementation
// =============================================================================

#include "cidc/ingest/file_extension.h"

#include "cidc/common/logger.h"

namespace cidc::ingest {

FileExtensionResolver::FileExtensionResolver() : table_(defaultTable()) {}

FileExtensionResolver::Table FileExtensionResolver::defaultTable() {
    return Table{
        {"fa", "FASTQ"},
        {"fa.gz", "FASTQ"},
        {"fq.gz", "FASTQ"},
    };
}

std::optional<std::string> FileExtensionResolver::resolve(std::string_view fileName) const {
    const std::size_t lastDot = fileName.rfind('.');
    const std::string_view lastSegment =
        (lastDot == std::string_view::npos) ? fileName : fileName.substr(lastDot + 1);
    if (auto it = table_.find(lastSegment); it != table_.end()) {
        return it->second;
    }

    if (lastDot != std::string_view::npos) {
        const std::size_t prevDot =
            (lastDot == 0) ? std::string_view::npos : fileName.rfind('.', lastDot - 1);
        // With no earlier dot the whole name is the two-segment suffix ("fq.gz")
        const std::size_t start = (prevDot == std::string_view::npos) ? 0 : prevDot + 1;
        if (auto it = table_.find(fileName.substr(start)); it != table_.end()) {
            return it->second;
        }
    }

    CIDC_LOG_WARNING("Extension of '{}' not recognized", fileName);
    return std::nullopt;
}

}  // namespace cidc::ingest
