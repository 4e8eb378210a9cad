// =============================================================================
// cidc-upload - Manifest Parser Property Tests
// =============================================================================
// Property-based tests for manifest structure detection.
//
// Properties:
// - A 13-column header with N well-formed rows yields N records keyed by the
//   trimmed header, for either delimiter
// - A header of any other width is rejected as a format error
// - Any row whose width differs from the header rejects the whole manifest
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "cidc/manifest/manifest_parser.h"
#include "support/test_support.h"

namespace cidc::manifest::test {

using cidc::test::buildManifest;
using cidc::test::joinRow;
using cidc::test::standardHeader;
using cidc::test::standardRow;

// =============================================================================
// RapidCheck Generators
// =============================================================================

namespace gen {

/// @brief A cell value without delimiters or line breaks.
[[nodiscard]] rc::Gen<std::string> cellValue() {
    return rc::gen::container<std::string>(
        rc::gen::inRange<std::size_t>(0, 12),
        rc::gen::oneOf(rc::gen::inRange('a', 'z' + 1), rc::gen::inRange('0', '9' + 1),
                       rc::gen::element('_', '-', '.', ' ')));
}

[[nodiscard]] rc::Gen<std::vector<std::string>> row(std::size_t width) {
    return rc::gen::container<std::vector<std::string>>(width, cellValue());
}

}  // namespace gen

namespace {

Result<Manifest> parseText(const std::string& text, ManifestParserOptions options = {}) {
    std::istringstream in(text);
    return ManifestParser(options).parse(in);
}

}  // namespace

// =============================================================================
// Properties
// =============================================================================

RC_GTEST_PROP(ManifestParserProperty, RowsBecomeRecordsKeyedByHeader, ()) {
    const auto rowCount = *rc::gen::inRange<std::size_t>(0, 40);
    const auto rows =
        *rc::gen::container<std::vector<std::vector<std::string>>>(rowCount, gen::row(13));
    const char delimiter = *rc::gen::element(',', '\t');

    auto manifest = parseText(buildManifest(standardHeader(), rows, delimiter));
    RC_ASSERT(manifest.has_value());
    RC_ASSERT(manifest->delimiter == delimiter);

    // Rows made only of spaces are blank lines and are skipped
    std::size_t expected = 0;
    for (const auto& row : rows) {
        if (joinRow(row, delimiter).find_first_not_of(" \t") != std::string::npos) {
            ++expected;
        }
    }
    RC_ASSERT(manifest->records.size() == expected);

    for (const auto& record : manifest->records) {
        RC_ASSERT(record.keys() == standardHeader());
    }
}

RC_GTEST_PROP(ManifestParserProperty, WrongHeaderWidthIsFormatError, ()) {
    const auto width = *rc::gen::suchThat(rc::gen::inRange<std::size_t>(1, 30),
                                          [](std::size_t w) { return w != 13; });
    std::vector<std::string> header;
    for (std::size_t i = 0; i < width; ++i) {
        header.push_back("COL_" + std::to_string(i));
    }
    const char delimiter = *rc::gen::element(',', '\t');

    auto manifest = parseText(buildManifest(header, {}, delimiter));
    RC_ASSERT(!manifest.has_value());
    RC_ASSERT(manifest.error().code() == ErrorCode::kManifestFormat);
}

RC_GTEST_PROP(ManifestParserProperty, MisalignedRowRejectsWholeManifest, ()) {
    const auto goodRows = *rc::gen::inRange<std::size_t>(0, 10);
    const auto badWidth = *rc::gen::suchThat(rc::gen::inRange<std::size_t>(1, 20),
                                             [](std::size_t w) { return w != 13; });

    std::vector<std::vector<std::string>> rows;
    for (std::size_t i = 0; i < goodRows; ++i) {
        rows.push_back(standardRow("CM-" + std::to_string(i)));
    }
    std::vector<std::string> bad(badWidth, "x");
    rows.push_back(bad);

    auto manifest = parseText(buildManifest(standardHeader(), rows));
    RC_ASSERT(!manifest.has_value());
    RC_ASSERT(manifest.error().code() == ErrorCode::kRecordShape);
    const auto location = "Row " + std::to_string(goodRows + 1) + " (line " +
                          std::to_string(goodRows + 2) + ")";
    RC_ASSERT(manifest.error().message().find(location) != std::string::npos);
}

// =============================================================================
// Unit Tests
// =============================================================================

TEST(ManifestParserTest, SplitKeepsEmptyFields) {
    EXPECT_EQ(ManifestParser::split("a,,b,", ','),
              (std::vector<std::string>{"a", "", "b", ""}));
}

TEST(ManifestParserTest, CommaWinsOverTab) {
    const auto header = joinRow(standardHeader(), ',');
    EXPECT_EQ(ManifestParser::detectDelimiter(header, 13), ',');
    EXPECT_EQ(ManifestParser::detectDelimiter(joinRow(standardHeader(), '\t'), 13), '\t');
    EXPECT_FALSE(ManifestParser::detectDelimiter(joinRow(standardHeader(), ';'), 13));
}

TEST(ManifestParserTest, HeaderTrimmedValuesKept) {
    auto header = standardHeader();
    header[1] = "  " + header[1] + " ";
    auto row = standardRow("CM-1");
    row[2] = " 1 ";

    auto manifest = parseText(buildManifest(header, {row}));
    ASSERT_TRUE(manifest.has_value()) << manifest.error().message();
    ASSERT_EQ(manifest->records.size(), 1u);

    const auto& record = manifest->records.front();
    EXPECT_EQ(record.valueOr(kColPatientId), "PT-CM-1");
    EXPECT_EQ(record.valueOr(kColTimepoint), " 1 ");
    EXPECT_EQ(record.sampleId(), "CM-1");
}

TEST(ManifestParserTest, CrLfLineEndingsAreStripped) {
    std::string text = joinRow(standardHeader(), ',') + "\r\n" +
                       joinRow(standardRow("CM-1"), ',') + "\r\n";

    auto manifest = parseText(text);
    ASSERT_TRUE(manifest.has_value()) << manifest.error().message();
    ASSERT_EQ(manifest->records.size(), 1u);
    EXPECT_EQ(manifest->header.back(), "COMMENTS");
    EXPECT_EQ(manifest->records.front().valueOr("COMMENTS", "missing"), "");
}

TEST(ManifestParserTest, BlankLinesAreSkipped) {
    std::string text = buildManifest(standardHeader(), {standardRow("CM-1")}) + "\n\n";

    auto manifest = parseText(text);
    ASSERT_TRUE(manifest.has_value());
    EXPECT_EQ(manifest->records.size(), 1u);
}

TEST(ManifestParserTest, ShapeErrorNamesRowAndFileLine) {
    std::string text = buildManifest(standardHeader(), {standardRow("CM-1")});
    text += "\n\n" + joinRow(standardRow("CM-2"), ',') + "\nbad,row\n";

    auto manifest = parseText(text);
    ASSERT_FALSE(manifest.has_value());
    EXPECT_EQ(manifest.error().code(), ErrorCode::kRecordShape);
    EXPECT_NE(manifest.error().message().find("Row 3 (line 6)"), std::string::npos)
        << manifest.error().message();
    EXPECT_NE(manifest.error().message().find("expected 13, found 2"), std::string::npos);
}

TEST(ManifestParserTest, EmptyInputIsFormatError) {
    auto manifest = parseText("");
    ASSERT_FALSE(manifest.has_value());
    EXPECT_EQ(manifest.error().code(), ErrorCode::kManifestFormat);
}

TEST(ManifestParserTest, DuplicateHeaderIsFormatError) {
    auto header = standardHeader();
    header.back() = header.front();

    auto manifest = parseText(buildManifest(header, {}));
    ASSERT_FALSE(manifest.has_value());
    EXPECT_EQ(manifest.error().code(), ErrorCode::kManifestFormat);
}

TEST(ManifestParserTest, LinesPastWindowAreIgnored) {
    std::vector<std::vector<std::string>> rows;
    for (int i = 0; i < 10; ++i) {
        rows.push_back(standardRow("CM-" + std::to_string(i)));
    }

    ManifestParserOptions options;
    options.lineWindow = 5;
    auto manifest = parseText(buildManifest(standardHeader(), rows), options);

    ASSERT_TRUE(manifest.has_value());
    EXPECT_EQ(manifest->records.size(), 4u);
    EXPECT_TRUE(manifest->truncated);
}

TEST(ManifestParserTest, MissingFileIsIoError) {
    auto manifest = ManifestParser{}.parseFile("/nonexistent/cidc/manifest.csv");
    ASSERT_FALSE(manifest.has_value());
    EXPECT_EQ(manifest.error().code(), ErrorCode::kIOError);
}

TEST(ManifestParserTest, RequiredColumnsAreChecked) {
    auto header = standardHeader();
    header[4] = "SOMETHING_ELSE";

    auto manifest = parseText(buildManifest(header, {}));
    ASSERT_TRUE(manifest.has_value());

    auto checked = checkRequiredColumns(*manifest);
    ASSERT_FALSE(checked.has_value());
    EXPECT_EQ(checked.error().code(), ErrorCode::kManifestFormat);
    EXPECT_NE(checked.error().message().find(std::string(kColBatchId)), std::string::npos);

    auto complete = parseText(buildManifest(standardHeader(), {}));
    ASSERT_TRUE(complete.has_value());
    EXPECT_TRUE(checkRequiredColumns(*complete).has_value());
}

}  // namespace cidc::manifest::test
