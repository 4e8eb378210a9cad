// =============================================================================
// cidc-upload - Transfer Engine Implementation
// =============================================================================

#include "cidc/transfer/transfer_engine.h"

#include <fmt/format.h>

#include "cidc/common/logger.h"

namespace cidc::transfer {

namespace {

std::string trimTrailingNewlines(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    return text;
}

}  // namespace

TransferEngine::TransferEngine(CommandRunner& runner, api::IngestionService& service,
                               TransferConfig config, ClockFn clock)
    : runner_(runner), service_(service), config_(std::move(config)), clock_(std::move(clock)) {}

std::string TransferEngine::destinationUri(const ingest::IngestionReceipt& receipt) {
    const std::string prefix =
        receipt.googleUrl.empty() ? std::string(kDefaultStoragePrefix) : receipt.googleUrl;
    return fmt::format("{}{}/{}", prefix, receipt.googleFolderPath, receipt.id);
}

std::vector<std::string> TransferEngine::buildCommand(const std::filesystem::path& sourceDir,
                                                      const ingest::IngestionReceipt& receipt,
                                                      std::size_t fileCount) const {
    std::vector<std::string> argv{config_.tool};
    if (useParallel(fileCount)) {
        argv.emplace_back("-m");
    }
    argv.emplace_back("cp");
    argv.emplace_back("-r");
    argv.push_back(sourceDir.string());
    argv.push_back(destinationUri(receipt));
    return argv;
}

bool TransferEngine::recordStatus(const ingest::IngestionReceipt& receipt,
                                  const ingest::StatusUpdate& update) {
    auto patched = service_.patchStatus(receipt, update);
    if (!patched) {
        CIDC_LOG_ERROR("{}", patched.error().message());
        return false;
    }
    CIDC_LOG_INFO("Ingestion {} marked {}", receipt.id,
                  jobProgressToString(update.status.progress));
    return true;
}

Result<TransferReport> TransferEngine::transfer(const std::filesystem::path& sourceDir,
                                                const ingest::IngestionReceipt& receipt,
                                                std::size_t fileCount) {
    const auto argv = buildCommand(sourceDir, receipt, fileCount);
    const std::string destination = argv.back();

    CIDC_LOG_INFO("Copying {} files from {} to {}{}", fileCount, sourceDir.string(), destination,
                  useParallel(fileCount) ? " (parallel)" : "");

    std::string failure;
    auto ran = runner_.run(argv);
    if (!ran) {
        failure = ran.error().message();
    } else if (!ran->succeeded()) {
        failure = fmt::format("{} exited with status {}", config_.tool, ran->exitCode);
        const auto output = trimTrailingNewlines(ran->output);
        if (!output.empty()) {
            failure += fmt::format(": {}", output);
        }
    }

    if (!failure.empty()) {
        CIDC_LOG_ERROR("Transfer for ingestion {} failed: {}", receipt.id, failure);
        recordStatus(receipt, ingest::StatusUpdate::aborted(failure));
        return makeError<TransferReport>(ErrorCode::kTransferFailed, std::move(failure));
    }

    TransferReport report{receipt.id, destination, true};
    report.statusRecorded = recordStatus(receipt, ingest::StatusUpdate::completed(clock_()));
    return report;
}

}  // namespace cidc::transfer
