// =============================================================================
// cidc-upload - File Extension Resolver Tests
// =============================================================================

#include "cidc/ingest/file_extension.h"

#include <gtest/gtest.h>

namespace cidc::ingest {
namespace {

TEST(FileExtensionResolverTest, DefaultTableRecognizesFastq) {
    FileExtensionResolver resolver;

    EXPECT_EQ(resolver.resolve("sample_R1.fq.gz"), "FASTQ");
    EXPECT_EQ(resolver.resolve("reference.fa"), "FASTQ");
    EXPECT_EQ(resolver.resolve("reference.fa.gz"), "FASTQ");
}

TEST(FileExtensionResolverTest, UnknownExtensionIsUnresolved) {
    FileExtensionResolver resolver;

    EXPECT_FALSE(resolver.resolve("aligned.bam").has_value());
    EXPECT_FALSE(resolver.resolve("reads.fastq").has_value());
    EXPECT_FALSE(resolver.resolve("archive.tar.gz").has_value());
    EXPECT_FALSE(resolver.resolve("").has_value());
}

TEST(FileExtensionResolverTest, SingleSegmentWinsOverCompoundSuffix) {
    FileExtensionResolver resolver(FileExtensionResolver::Table{
        {"gz", "GZIP"},
        {"fq.gz", "FASTQ"},
    });

    EXPECT_EQ(resolver.resolve("reads.fq.gz"), "GZIP");
}

TEST(FileExtensionResolverTest, BareNamesMatchWholeName) {
    FileExtensionResolver resolver;

    EXPECT_EQ(resolver.resolve("fa"), "FASTQ");
    EXPECT_EQ(resolver.resolve("fq.gz"), "FASTQ");
    EXPECT_FALSE(resolver.resolve("fq").has_value());
}

TEST(FileExtensionResolverTest, CustomTableReplacesDefaults) {
    FileExtensionResolver resolver(FileExtensionResolver::Table{{"bam", "BAM"}});

    EXPECT_EQ(resolver.resolve("aligned.bam"), "BAM");
    EXPECT_FALSE(resolver.resolve("reads.fq.gz").has_value());
    EXPECT_EQ(resolver.table().size(), 1u);
}

}  // namespace
}  // namespace cidc::ingest
