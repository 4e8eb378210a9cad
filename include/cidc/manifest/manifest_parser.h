// =============================================================================
// cidc-upload - Manifest Parser
// =============================================================================
// Parser for the tabular upload manifest that describes one batch.
//
// This module provides:
// - ManifestRecord: one data row, an ordered header -> value mapping
// - Manifest: header, detected delimiter, and the parsed records
// - ManifestParser: delimiter detection and row-shape validation
//
// Schema rules:
// - The first line is the header and defines the key set of every record
// - The delimiter is ',' if the header splits into exactly 13 fields,
//   otherwise '\t' if it does, otherwise the manifest is rejected
// - Every data row must split into exactly as many fields as the header
// - Header names are trimmed; values are kept as written
// - Only the first 500 lines are read
//
// Usage:
//   ManifestParser parser;
//   auto manifest = parser.parseFile("/data/batch/manifest.tsv");
//   if (!manifest) { ... manifest.error() ... }
//   for (const auto& record : manifest->records) { ... }
// =============================================================================

#ifndef CIDC_MANIFEST_MANIFEST_PARSER_H
#define CIDC_MANIFEST_MANIFEST_PARSER_H

#include <cstddef>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "cidc/common/error.h"
#include "cidc/common/types.h"

namespace cidc::manifest {

// =============================================================================
// Manifest Record
// =============================================================================

/// @brief One manifest data row; immutable once parsed.
class ManifestRecord {
public:
    using Field = std::pair<std::string, std::string>;

    ManifestRecord() = default;

    /// @brief Construct from header-ordered (key, value) pairs.
    explicit ManifestRecord(std::vector<Field> fields) : fields_(std::move(fields)) {}

    /// @brief Look up a value by header name.
    [[nodiscard]] std::optional<std::string_view> find(std::string_view key) const noexcept;

    /// @brief Look up a value by header name, empty when absent.
    [[nodiscard]] std::string_view valueOr(std::string_view key,
                                           std::string_view fallback = {}) const noexcept;

    [[nodiscard]] bool contains(std::string_view key) const noexcept {
        return find(key).has_value();
    }

    /// @brief Fields in header order.
    [[nodiscard]] const std::vector<Field>& fields() const noexcept { return fields_; }

    /// @brief Header names in order.
    [[nodiscard]] std::vector<std::string> keys() const;

    [[nodiscard]] std::size_t size() const noexcept { return fields_.size(); }

    /// @brief Convenience accessor for the #CIMAC_SAMPLE_ID column.
    [[nodiscard]] std::string_view sampleId() const noexcept { return valueOr(kColSampleId); }

private:
    std::vector<Field> fields_;
};

// =============================================================================
// Manifest
// =============================================================================

/// @brief Parsed manifest.
struct Manifest {
    /// @brief Trimmed header names in column order.
    std::vector<std::string> header;

    /// @brief Detected delimiter (',' or '\t').
    char delimiter = ',';

    /// @brief Data rows in file order.
    std::vector<ManifestRecord> records;

    /// @brief True when lines past the read window were ignored.
    bool truncated = false;
};

// =============================================================================
// Parser Options
// =============================================================================

struct ManifestParserOptions {
    /// @brief Maximum number of lines read, header included.
    std::size_t lineWindow = kManifestLineWindow;

    /// @brief Exact column count the header must split into.
    std::size_t expectedColumns = kManifestColumnCount;
};

// =============================================================================
// ManifestParser Class
// =============================================================================

/// @brief Reads a delimited manifest into ManifestRecords.
///
/// Errors:
/// - kManifestFormat: empty file, unrecognized delimiter/column count,
///   duplicate header names
/// - kRecordShape: a data row with the wrong number of columns
/// - kIOError: the file cannot be opened
class ManifestParser {
public:
    explicit ManifestParser(ManifestParserOptions options = {});

    /// @brief Parse a manifest file.
    [[nodiscard]] Result<Manifest> parseFile(const std::filesystem::path& path) const;

    /// @brief Parse a manifest from an open stream.
    [[nodiscard]] Result<Manifest> parse(std::istream& in) const;

    [[nodiscard]] const ManifestParserOptions& options() const noexcept { return options_; }

    /// @brief Pick the delimiter for a header line.
    /// @return ',' or '\t', nullopt when neither yields expectedColumns fields.
    [[nodiscard]] static std::optional<char> detectDelimiter(std::string_view headerLine,
                                                             std::size_t expectedColumns);

    /// @brief Split on every delimiter occurrence; empty fields are kept.
    [[nodiscard]] static std::vector<std::string> split(std::string_view line, char delimiter);

private:
    ManifestParserOptions options_;
};

/// @brief Verify the header carries every metadata column the payload needs.
/// @return kManifestFormat naming the missing columns.
[[nodiscard]] VoidResult checkRequiredColumns(const Manifest& manifest);

}  // namespace cidc::manifest

#endif  // CIDC_MANIFEST_MANIFEST_PARSER_H
