// =============================================================================
// cidc-upload - Payload Builder Property Tests
// =============================================================================
// Properties:
// - Each record yields exactly one submission per non-static input column it
//   carries, in header order
// - Pairing labels are two independent flags derived from the column name
// - A single missing file or unknown extension rejects the whole batch
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <string>
#include <vector>

#include "cidc/ingest/payload_builder.h"
#include "support/test_support.h"

namespace cidc::ingest::test {

using cidc::test::fastqInputs;
using cidc::test::standardHeader;
using cidc::test::standardRow;
using cidc::test::TempDir;

namespace {

Selections makeSelections() {
    Selections selections;
    selections.trial = TrialSelection{"trial-1", "Trial One", {"CM-1", "CM-2"}};
    selections.assay = AssaySelection{"assay-1", "WES"};
    selections.session = Session{"jwt", Clock::now(), kDefaultSessionTtl};
    return selections;
}

manifest::ManifestRecord makeRecord(const std::vector<std::string>& header,
                                    const std::vector<std::string>& row) {
    std::vector<manifest::ManifestRecord::Field> fields;
    for (std::size_t i = 0; i < header.size(); ++i) {
        fields.emplace_back(header[i], row[i]);
    }
    return manifest::ManifestRecord(std::move(fields));
}

/// Create every file a standard row references.
void createFilesFor(const TempDir& dir, const std::string& sampleId) {
    const auto row = standardRow(sampleId);
    for (std::size_t i = 8; i < 12; ++i) {
        dir.writeFile(row[i], std::string(10 + i, 'A'));
    }
}

}  // namespace

// =============================================================================
// Pairing
// =============================================================================

TEST(PayloadBuilderTest, PairingLabelsFollowColumn) {
    EXPECT_EQ(PayloadBuilder::pairingFor(kColFastqTumor1), (PairingLabels{"TUMOR", "PAIR 1"}));
    EXPECT_EQ(PayloadBuilder::pairingFor(kColFastqTumor2), (PairingLabels{"TUMOR", "PAIR 2"}));
    EXPECT_EQ(PayloadBuilder::pairingFor(kColFastqNormal1),
              (PairingLabels{"NORMAL", "PAIR 1"}));
    EXPECT_EQ(PayloadBuilder::pairingFor(kColFastqNormal2),
              (PairingLabels{"NORMAL", "PAIR 2"}));
    EXPECT_EQ(PayloadBuilder::pairingFor("OTHER_FILE"), (PairingLabels{"TUMOR", "PAIR 1"}));
}

// =============================================================================
// Expansion
// =============================================================================

TEST(PayloadBuilderTest, RecordExpandsToOneSubmissionPerInputColumn) {
    TempDir dir;
    createFilesFor(dir, "CM-1");
    const auto selections = makeSelections();
    PayloadBuilder builder(fastqInputs(), selections, dir.path());

    auto payload = builder.buildRecord(makeRecord(standardHeader(), standardRow("CM-1")));
    ASSERT_EQ(payload.submissions.size(), 4u);
    EXPECT_EQ(payload.fileNames,
              (std::vector<std::string>{"CM-1_T_R1.fq.gz", "CM-1_T_R2.fq.gz",
                                        "CM-1_N_R1.fq.gz", "CM-1_N_R2.fq.gz"}));

    const auto& normal2 = payload.submissions[3];
    EXPECT_EQ(normal2.mapping, kColFastqNormal2);
    EXPECT_EQ(normal2.assayId, "assay-1");
    EXPECT_EQ(normal2.assayName, "WES");
    EXPECT_EQ(normal2.trialId, "trial-1");
    EXPECT_EQ(normal2.trialName, "Trial One");
    EXPECT_EQ(normal2.dataFormat, "FASTQ");
    EXPECT_EQ(normal2.fileSize, 21u);
    EXPECT_EQ(normal2.sampleIds, (std::vector<std::string>{"CM-1"}));
    EXPECT_EQ(normal2.numberOfSamples(), 1u);
    EXPECT_EQ(normal2.pairing.patientId, "PT-CM-1");
    EXPECT_EQ(normal2.pairing.timepointUnit, "day");
    EXPECT_EQ(normal2.pairing.insertSize, "300");
    EXPECT_EQ(normal2.pairing.tumorNormal, "NORMAL");
    EXPECT_EQ(normal2.pairing.pairLabel, "PAIR 2");
}

TEST(PayloadBuilderTest, NoInputColumnsYieldsNothing) {
    TempDir dir;
    const auto selections = makeSelections();
    PayloadBuilder builder({}, selections, dir.path());

    auto payload = builder.buildRecord(makeRecord(standardHeader(), standardRow("CM-1")));
    EXPECT_TRUE(payload.submissions.empty());
    EXPECT_TRUE(payload.fileNames.empty());
}

RC_GTEST_PROP(PayloadBuilderProperty, SubmissionCountMatchesInputColumns, ()) {
    const auto records = *rc::gen::inRange<std::size_t>(0, 6);
    const auto mask = *rc::gen::container<std::vector<bool>>(4, rc::gen::arbitrary<bool>());
    const std::vector<std::string> candidates{
        std::string(kColFastqTumor1), std::string(kColFastqTumor2),
        std::string(kColFastqNormal1), std::string(kColFastqNormal2)};
    std::vector<std::string> columns;
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        if (mask[i]) {
            columns.push_back(candidates[i]);
        }
    }

    TempDir dir;
    const auto selections = makeSelections();
    PayloadBuilder builder(PayloadBuilder::InputSet(columns.begin(), columns.end()), selections,
                           dir.path());

    std::vector<manifest::ManifestRecord> rows;
    for (std::size_t i = 0; i < records; ++i) {
        rows.push_back(makeRecord(standardHeader(), standardRow("CM-" + std::to_string(i))));
    }

    auto payload = builder.buildAll(rows);
    RC_ASSERT(payload.submissions.size() == records * columns.size());
    RC_ASSERT(payload.fileNames.size() == payload.submissions.size());
    for (const auto& file : payload.submissions) {
        const auto labels = PayloadBuilder::pairingFor(file.mapping);
        RC_ASSERT(file.pairing.tumorNormal == labels.tumorNormal);
        RC_ASSERT(file.pairing.pairLabel == labels.pairLabel);
    }
}

// =============================================================================
// Batch Atomicity
// =============================================================================

TEST(PayloadBuilderTest, BuildSucceedsWhenEverythingResolves) {
    TempDir dir;
    createFilesFor(dir, "CM-1");
    createFilesFor(dir, "CM-2");
    const auto selections = makeSelections();
    PayloadBuilder builder(fastqInputs(), selections, dir.path());

    auto built = builder.build({makeRecord(standardHeader(), standardRow("CM-1")),
                                makeRecord(standardHeader(), standardRow("CM-2"))});
    ASSERT_TRUE(built.has_value()) << built.error().message();
    EXPECT_EQ(built->batch.fileCount(), 8u);
    EXPECT_EQ(built->batch.status(), JobStatus::inProgress());
    EXPECT_EQ(built->fileNames.size(), 8u);
}

TEST(PayloadBuilderTest, OneMissingFileRejectsBatch) {
    TempDir dir;
    createFilesFor(dir, "CM-1");
    createFilesFor(dir, "CM-2");
    std::filesystem::remove(dir.path() / "CM-2_N_R2.fq.gz");
    const auto selections = makeSelections();
    PayloadBuilder builder(fastqInputs(), selections, dir.path());

    auto built = builder.build({makeRecord(standardHeader(), standardRow("CM-1")),
                                makeRecord(standardHeader(), standardRow("CM-2"))});
    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code(), ErrorCode::kFileNotFound);
    EXPECT_NE(built.error().message().find("CM-2_N_R2.fq.gz"), std::string::npos);
}

TEST(PayloadBuilderTest, UnknownExtensionRejectsBatch) {
    TempDir dir;
    createFilesFor(dir, "CM-1");
    auto row = standardRow("CM-1");
    row[9] = "CM-1_T_R2.bam";
    dir.writeFile(row[9], "BAM");
    const auto selections = makeSelections();
    PayloadBuilder builder(fastqInputs(), selections, dir.path());

    auto built = builder.build({makeRecord(standardHeader(), row)});
    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code(), ErrorCode::kUnsupportedFormat);
    EXPECT_NE(built.error().message().find("CM-1_T_R2.bam"), std::string::npos);
}

TEST(PayloadBuilderTest, MissingFileReportedBeforeUnknownExtension) {
    std::vector<FileSubmission> files(2);
    files[0].fileName = "a.bam";
    files[0].fileSize = 3;
    files[1].fileName = "b.fq.gz";
    files[1].dataFormat = "FASTQ";

    auto checked = PayloadBuilder::checkResolved(files);
    ASSERT_FALSE(checked.has_value());
    EXPECT_EQ(checked.error().code(), ErrorCode::kFileNotFound);
}

}  // namespace cidc::ingest::test
