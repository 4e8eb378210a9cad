// =============================================================================
// cidc-upload - Transfer Engine
// =============================================================================
// Copies the local manifest directory into the storage location the backend
// assigned to a batch, then records the outcome on the batch.
//
// Command shape:
//   <tool> [-m] cp -r <source directory> <storage url><folder path>/<id>
//
// The parallel flag (-m) is added only when the batch holds more files than
// TransferConfig::parallelThreshold.
//
// After the copy exactly one status update is sent:
// - Completed with the current time on success
// - Aborted with the failure text otherwise
// A failed status update is logged and reported in TransferReport but never
// changes the transfer outcome.
// =============================================================================

#ifndef CIDC_TRANSFER_TRANSFER_ENGINE_H
#define CIDC_TRANSFER_TRANSFER_ENGINE_H

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "cidc/api/ingestion_service.h"
#include "cidc/common/error.h"
#include "cidc/common/session.h"
#include "cidc/ingest/submission.h"
#include "cidc/transfer/command_runner.h"

namespace cidc::transfer {

/// @brief Default file count above which the tool runs in parallel mode.
inline constexpr std::size_t kDefaultParallelThreshold = 3;

inline constexpr std::string_view kDefaultTransferTool = "gsutil";

/// @brief Scheme prefix used when the backend does not send google_url.
inline constexpr std::string_view kDefaultStoragePrefix = "gs://";

struct TransferConfig {
    std::string tool{kDefaultTransferTool};
    std::size_t parallelThreshold = kDefaultParallelThreshold;
};

/// @brief Outcome of a successful copy.
struct TransferReport {
    std::string ingestionId;
    std::string destination;

    /// @brief False if the Completed status could not be recorded.
    bool statusRecorded = true;
};

class TransferEngine {
public:
    using ClockFn = std::function<Clock::time_point()>;

    TransferEngine(CommandRunner& runner, api::IngestionService& service,
                   TransferConfig config = {}, ClockFn clock = &Clock::now);

    /// @brief Storage URI the batch is copied to.
    [[nodiscard]] static std::string destinationUri(const ingest::IngestionReceipt& receipt);

    [[nodiscard]] bool useParallel(std::size_t fileCount) const noexcept {
        return fileCount > config_.parallelThreshold;
    }

    [[nodiscard]] std::vector<std::string> buildCommand(const std::filesystem::path& sourceDir,
                                                        const ingest::IngestionReceipt& receipt,
                                                        std::size_t fileCount) const;

    /// @brief Copy sourceDir and record the result on the batch.
    /// @return The report on success; kTransferFailed if the copy failed (the
    ///         batch has been marked Aborted when the backend allowed it).
    [[nodiscard]] Result<TransferReport> transfer(const std::filesystem::path& sourceDir,
                                                  const ingest::IngestionReceipt& receipt,
                                                  std::size_t fileCount);

    [[nodiscard]] const TransferConfig& config() const noexcept { return config_; }

private:
    /// @brief Send the status update, logging a failure; true on success.
    bool recordStatus(const ingest::IngestionReceipt& receipt,
                      const ingest::StatusUpdate& update);

    CommandRunner& runner_;
    api::IngestionService& service_;
    TransferConfig config_;
    ClockFn clock_;
};

}  // namespace cidc::transfer

#endif  // CIDC_TRANSFER_TRANSFER_ENGINE_H
