// =============================================================================
// cidc-upload - Ingestion Service
// =============================================================================
// Client for the remote ingestion API.
//
// This module provides:
// - IngestionService: abstract interface used by the transfer engine, the
//   status tracker and the upload pipeline
// - RestIngestionService: HTTP/JSON implementation over an HttpTransport
//
// Endpoints:
//   POST  /ingestion        create a batch (201, _id/_etag, storage headers)
//   PATCH /ingestion/{id}   apply a status update (If-Match: etag)
//   GET   /ingestion/{id}   read one batch's status
//   GET   /status           list the caller's jobs
//   GET   /trials/{id}      trial name, sample ids and assays
//   GET   /assays/{id}      assay name and non-static inputs
// =============================================================================

#ifndef CIDC_API_INGESTION_SERVICE_H
#define CIDC_API_INGESTION_SERVICE_H

#include <string>
#include <vector>

#include "cidc/api/http_transport.h"
#include "cidc/api/json_codec.h"
#include "cidc/common/error.h"
#include "cidc/common/session.h"
#include "cidc/ingest/submission.h"

namespace cidc::api {

/// @brief Operations the upload client needs from the ingestion backend.
class IngestionService {
public:
    virtual ~IngestionService() = default;

    /// @brief Register a batch; the backend assigns its id and storage location.
    [[nodiscard]] virtual Result<ingest::IngestionReceipt> createIngestion(
        const ingest::IngestionBatch& batch) = 0;

    /// @brief Apply a status update to a created batch.
    /// @return kStatusUpdateFailed if the backend rejects the update.
    [[nodiscard]] virtual VoidResult patchStatus(const ingest::IngestionReceipt& receipt,
                                                 const ingest::StatusUpdate& update) = 0;

    [[nodiscard]] virtual Result<JobStatus> getIngestionStatus(const std::string& id) = 0;

    [[nodiscard]] virtual Result<std::vector<JobSummary>> listJobs() = 0;

    [[nodiscard]] virtual Result<TrialInfo> getTrial(const std::string& trialId) = 0;

    [[nodiscard]] virtual Result<AssayInfo> getAssay(const std::string& assayId) = 0;
};

/// @brief IngestionService over HTTP with bearer-token authentication.
class RestIngestionService : public IngestionService {
public:
    RestIngestionService(HttpTransport& transport, Session session);

    [[nodiscard]] Result<ingest::IngestionReceipt> createIngestion(
        const ingest::IngestionBatch& batch) override;

    [[nodiscard]] VoidResult patchStatus(const ingest::IngestionReceipt& receipt,
                                         const ingest::StatusUpdate& update) override;

    [[nodiscard]] Result<JobStatus> getIngestionStatus(const std::string& id) override;

    [[nodiscard]] Result<std::vector<JobSummary>> listJobs() override;

    [[nodiscard]] Result<TrialInfo> getTrial(const std::string& trialId) override;

    [[nodiscard]] Result<AssayInfo> getAssay(const std::string& assayId) override;

private:
    /// @brief Send a request with auth headers and require the given status.
    [[nodiscard]] Result<HttpResponse> exchange(HttpRequest request, unsigned expectedStatus);

    /// @brief exchange() followed by parseBody().
    [[nodiscard]] Result<nlohmann::json> fetchJson(const std::string& target);

    HttpTransport& transport_;
    Session session_;
};

}  // namespace cidc::api

#endif  // CIDC_API_INGESTION_SERVICE_H
