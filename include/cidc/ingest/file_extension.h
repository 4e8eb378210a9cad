// =============================================================================
// cidc-upload - File Extension Resolver
// =============================================================================
// Maps a file name suffix to the data-format label the ingestion API expects.
//
// Resolution order:
// 1. Final dot-segment            ("reads.fa"     -> "fa")
// 2. Last two dot-segments joined ("reads.fq.gz"  -> "fq.gz")
// 3. Otherwise unresolved
// =============================================================================

#ifndef CIDC_INGEST_FILE_EXTENSION_H
#define CIDC_INGEST_FILE_EXTENSION_H

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace cidc::ingest {

class FileExtensionResolver {
public:
    using Table = std::map<std::string, std::string, std::less<>>;

    /// @brief Resolver over the default extension table.
    FileExtensionResolver();

    /// @brief Resolver over a custom extension table.
    explicit FileExtensionResolver(Table table) : table_(std::move(table)) {}

    /// @brief Resolve a file name to a data-format label.
    /// @return The label, or nullopt when neither suffix is known.
    [[nodiscard]] std::optional<std::string> resolve(std::string_view fileName) const;

    /// @brief Extension -> label table in use.
    [[nodiscard]] const Table& table() const noexcept { return table_; }

    /// @brief fa, fa.gz and fq.gz -> FASTQ.
    [[nodiscard]] static Table defaultTable();

private:
    Table table_;
};

}  // namespace cidc::ingest

#endif  // CIDC_INGEST_FILE_EXTENSION_H
