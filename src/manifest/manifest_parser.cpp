// =============================================================================
// cidc-upload - Manifest Parser Implementation
// =============================================================================

#include "cidc/manifest/manifest_parser.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "cidc/common/logger.h"

namespace cidc::manifest {

namespace {

/// @brief Remove a trailing "\n" / "\r\n" left by getline on CRLF files.
void stripLineTerminator(std::string& line) {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }
}

std::string trim(std::string_view str) {
    auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(str.begin(), str.end(), isSpace);
    auto end = std::find_if_not(str.rbegin(), std::string_view::reverse_iterator(begin), isSpace)
                   .base();
    return std::string(begin, end);
}

bool isBlank(std::string_view line) {
    return std::all_of(line.begin(), line.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace

// =============================================================================
// ManifestRecord Implementation
// =============================================================================

std::optional<std::string_view> ManifestRecord::find(std::string_view key) const noexcept {
    for (const auto& [name, value] : fields_) {
        if (name == key) {
            return std::string_view(value);
        }
    }
    return std::nullopt;
}

std::string_view ManifestRecord::valueOr(std::string_view key,
                                         std::string_view fallback) const noexcept {
    return find(key).value_or(fallback);
}

std::vector<std::string> ManifestRecord::keys() const {
    std::vector<std::string> result;
    result.reserve(fields_.size());
    for (const auto& field : fields_) {
        result.push_back(field.first);
    }
    return result;
}

// =============================================================================
// ManifestParser Implementation
// =============================================================================

ManifestParser::ManifestParser(ManifestParserOptions options) : options_(options) {}

std::vector<std::string> ManifestParser::split(std::string_view line, char delimiter) {
    std::vector<std::string> fields;
    std::size_t start = 0;
    while (true) {
        std::size_t pos = line.find(delimiter, start);
        if (pos == std::string_view::npos) {
            fields.emplace_back(line.substr(start));
            break;
        }
        fields.emplace_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

std::optional<char> ManifestParser::detectDelimiter(std::string_view headerLine,
                                                    std::size_t expectedColumns) {
    for (char candidate : {',', '\t'}) {
        if (split(headerLine, candidate).size() == expectedColumns) {
            return candidate;
        }
    }
    return std::nullopt;
}

Result<Manifest> ManifestParser::parseFile(const std::filesystem::path& path) const {
    std::ifstream in(path);
    if (!in) {
        return makeError<Manifest>(ErrorCode::kIOError,
                                   fmt::format("Failed to open manifest: {}", path.string()));
    }
    CIDC_LOG_DEBUG("Parsing manifest {}", path.string());
    return parse(in);
}

Result<Manifest> ManifestParser::parse(std::istream& in) const {
    Manifest manifest;

    std::string headerLine;
    if (!std::getline(in, headerLine)) {
        return makeError<Manifest>(ErrorCode::kManifestFormat, "Manifest is empty");
    }
    stripLineTerminator(headerLine);

    auto delimiter = detectDelimiter(headerLine, options_.expectedColumns);
    if (!delimiter) {
        return makeError<Manifest>(
            ErrorCode::kManifestFormat,
            fmt::format("Unable to recognize metadata format: header must have exactly {} "
                        "comma- or tab-separated columns",
                        options_.expectedColumns));
    }
    manifest.delimiter = *delimiter;

    std::set<std::string, std::less<>> seen;
    for (const auto& raw : split(headerLine, manifest.delimiter)) {
        std::string name = trim(raw);
        if (!seen.insert(name).second) {
            return makeError<Manifest>(ErrorCode::kManifestFormat,
                                       fmt::format("Duplicate manifest column: '{}'", name));
        }
        manifest.header.push_back(std::move(name));
    }

    std::size_t linesRead = 1;
    std::uint64_t rowNumber = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (linesRead >= options_.lineWindow) {
            manifest.truncated = true;
            break;
        }
        ++linesRead;
        stripLineTerminator(line);
        if (isBlank(line)) {
            continue;
        }

        ++rowNumber;
        auto columns = split(line, manifest.delimiter);
        if (columns.size() != manifest.header.size()) {
            return makeError<Manifest>(RecordShapeError(fmt::format(
                "Row {} (line {}) has the wrong number of columns: expected {}, found {}",
                rowNumber, linesRead, manifest.header.size(), columns.size())));
        }

        std::vector<ManifestRecord::Field> fields;
        fields.reserve(columns.size());
        for (std::size_t i = 0; i < columns.size(); ++i) {
            fields.emplace_back(manifest.header[i], std::move(columns[i]));
        }
        manifest.records.emplace_back(std::move(fields));
    }

    if (manifest.truncated) {
        CIDC_LOG_WARNING("Manifest exceeds {} lines; remaining lines were ignored",
                         options_.lineWindow);
    }
    CIDC_LOG_DEBUG("Manifest delimiter '{}', {} columns, {} records",
                   manifest.delimiter == '\t' ? "\\t" : ",", manifest.header.size(),
                   manifest.records.size());
    return manifest;
}

// =============================================================================
// Required Columns
// =============================================================================

VoidResult checkRequiredColumns(const Manifest& manifest) {
    std::vector<std::string_view> missing;
    for (std::string_view column : kRequiredManifestColumns) {
        if (std::find(manifest.header.begin(), manifest.header.end(), column) ==
            manifest.header.end()) {
            missing.push_back(column);
        }
    }
    if (!missing.empty()) {
        return makeVoidError(ErrorCode::kManifestFormat,
                             fmt::format("Manifest is missing required columns: {}",
                                         fmt::join(missing, ", ")));
    }
    return makeVoidSuccess();
}

}  // namespace cidc::manifest
