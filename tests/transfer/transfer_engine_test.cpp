// =============================================================================
// cidc-upload - Transfer Engine Tests
// =============================================================================

#include "cidc/transfer/transfer_engine.h"

#include <gtest/gtest.h>

#include "support/test_support.h"

namespace cidc::transfer {
namespace {

using cidc::test::FakeCommandRunner;
using cidc::test::FakeIngestionService;

const Clock::time_point kFixedNow{std::chrono::seconds{1'700'000'000}};

class TransferEngineTest : public ::testing::Test {
protected:
    TransferEngine makeEngine(TransferConfig config = {}) {
        return TransferEngine(runner_, service_, std::move(config),
                              [] { return kFixedNow; });
    }

    FakeCommandRunner runner_;
    FakeIngestionService service_;
    ingest::IngestionReceipt receipt_{"ing-1", "etag-1", "trial-1/run", ""};
};

// =============================================================================
// Command Construction
// =============================================================================

TEST_F(TransferEngineTest, DestinationUsesDefaultPrefix) {
    EXPECT_EQ(TransferEngine::destinationUri(receipt_), "gs://trial-1/run/ing-1");

    receipt_.googleUrl = "gs://cidc-uploads/";
    EXPECT_EQ(TransferEngine::destinationUri(receipt_), "gs://cidc-uploads/trial-1/run/ing-1");
}

TEST_F(TransferEngineTest, ParallelOnlyAboveThreshold) {
    auto engine = makeEngine();

    EXPECT_EQ(engine.buildCommand("/data", receipt_, 3),
              (std::vector<std::string>{"gsutil", "cp", "-r", "/data", "gs://trial-1/run/ing-1"}));
    EXPECT_EQ(engine.buildCommand("/data", receipt_, 4),
              (std::vector<std::string>{"gsutil", "-m", "cp", "-r", "/data",
                                        "gs://trial-1/run/ing-1"}));
}

TEST_F(TransferEngineTest, ToolAndThresholdAreConfigurable) {
    auto engine = makeEngine(TransferConfig{"/opt/bin/gsutil", 0});

    EXPECT_TRUE(engine.useParallel(1));
    EXPECT_FALSE(engine.useParallel(0));
    EXPECT_EQ(engine.buildCommand("/data", receipt_, 1).front(), "/opt/bin/gsutil");
}

// =============================================================================
// Outcomes
// =============================================================================

TEST_F(TransferEngineTest, SuccessMarksCompleted) {
    auto engine = makeEngine();

    auto report = engine.transfer("/data", receipt_, 8);
    ASSERT_TRUE(report.has_value()) << report.error().message();
    EXPECT_EQ(report->ingestionId, "ing-1");
    EXPECT_EQ(report->destination, "gs://trial-1/run/ing-1");
    EXPECT_TRUE(report->statusRecorded);

    ASSERT_EQ(runner_.commands.size(), 1u);
    EXPECT_EQ(runner_.commands.front()[1], "-m");

    ASSERT_EQ(service_.patches.size(), 1u);
    EXPECT_EQ(service_.patchedIds.front(), "ing-1");
    EXPECT_EQ(service_.patches.front().status, JobStatus::completed());
    EXPECT_EQ(service_.patches.front().endTime, ingest::toIsoTimestamp(kFixedNow));
}

TEST_F(TransferEngineTest, NonZeroExitMarksAborted) {
    runner_.output = CommandOutput{1, "AccessDeniedException: 403\n"};
    auto engine = makeEngine();

    auto report = engine.transfer("/data", receipt_, 2);
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code(), ErrorCode::kTransferFailed);
    EXPECT_EQ(report.error().message(),
              "gsutil exited with status 1: AccessDeniedException: 403");

    ASSERT_EQ(service_.patches.size(), 1u);
    EXPECT_EQ(service_.patches.front().status,
              JobStatus::aborted("gsutil exited with status 1: AccessDeniedException: 403"));
    EXPECT_FALSE(service_.patches.front().endTime.has_value());
}

TEST_F(TransferEngineTest, LaunchFailureMarksAborted) {
    runner_.launchError = Error(ErrorCode::kTransferFailed, "gsutil was not found on PATH");
    auto engine = makeEngine();

    auto report = engine.transfer("/data", receipt_, 2);
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code(), ErrorCode::kTransferFailed);

    ASSERT_EQ(service_.patches.size(), 1u);
    EXPECT_EQ(service_.patches.front().status.progress, JobProgress::kAborted);
    EXPECT_EQ(service_.patches.front().status.message, "gsutil was not found on PATH");
}

TEST_F(TransferEngineTest, FailedStatusPatchDoesNotMaskSuccess) {
    service_.patchError = Error(ErrorCode::kStatusUpdateFailed, "etag mismatch");
    auto engine = makeEngine();

    auto report = engine.transfer("/data", receipt_, 1);
    ASSERT_TRUE(report.has_value());
    EXPECT_FALSE(report->statusRecorded);
}

TEST_F(TransferEngineTest, FailedStatusPatchDoesNotMaskFailure) {
    runner_.output = CommandOutput{2, ""};
    service_.patchError = Error(ErrorCode::kStatusUpdateFailed, "etag mismatch");
    auto engine = makeEngine();

    auto report = engine.transfer("/data", receipt_, 1);
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code(), ErrorCode::kTransferFailed);
    EXPECT_EQ(report.error().message(), "gsutil exited with status 2");
}

// =============================================================================
// Process Runner
// =============================================================================

TEST(ProcessCommandRunnerTest, EmptyCommandIsRejected) {
    ProcessCommandRunner runner;
    auto ran = runner.run({});
    ASSERT_FALSE(ran.has_value());
    EXPECT_EQ(ran.error().code(), ErrorCode::kInvalidArgument);
}

TEST(ProcessCommandRunnerTest, MissingToolIsTransferFailure) {
    ProcessCommandRunner runner;
    auto ran = runner.run({"cidc-no-such-transfer-tool", "cp"});
    ASSERT_FALSE(ran.has_value());
    EXPECT_EQ(ran.error().code(), ErrorCode::kTransferFailed);
}

TEST(ProcessCommandRunnerTest, FormatsCommandLine) {
    EXPECT_EQ(formatCommandLine({"gsutil", "cp", "-r", "/my data", "gs://b/x"}),
              "gsutil cp -r \"/my data\" gs://b/x");
}

}  // namespace
}  // namespace cidc::transfer
