// =============================================================================
// cidc-upload - Ingestion Service Implementation
// =============================================================================

#include "cidc/api/ingestion_service.h"

#include <fmt/format.h>

#include "cidc/common/logger.h"

namespace cidc::api {

namespace {

constexpr unsigned kHttpOk = 200;
constexpr unsigned kHttpCreated = 201;
constexpr unsigned kHttpUnauthorized = 401;

constexpr const char* kFolderPathHeader = "google_folder_path";
constexpr const char* kStorageUrlHeader = "google_url";

/// Keep error messages readable when the backend returns an HTML page.
std::string abbreviate(const std::string& body) {
    constexpr std::size_t kMaxBody = 200;
    if (body.size() <= kMaxBody) {
        return body;
    }
    return body.substr(0, kMaxBody) + "...";
}

}  // namespace

RestIngestionService::RestIngestionService(HttpTransport& transport, Session session)
    : transport_(transport), session_(std::move(session)) {}

Result<HttpResponse> RestIngestionService::exchange(HttpRequest request,
                                                    unsigned expectedStatus) {
    request.headers["Authorization"] = session_.authorizationHeader();

    auto response = transport_.send(request);
    if (!response) {
        return std::unexpected(response.error());
    }

    if (response->status == kHttpUnauthorized) {
        return makeError<HttpResponse>(
            ErrorCode::kAuthError,
            fmt::format("{} {} was rejected: session is not authorized, log in again",
                        httpMethodToString(request.method), request.target));
    }
    if (response->status != expectedStatus) {
        CIDC_LOG_DEBUG("Rejected response body: {}", abbreviate(response->body));
        return makeError<HttpResponse>(TransportError(
            expectedStatus, response->status,
            fmt::format("{} {}", httpMethodToString(request.method), request.target)));
    }
    return response;
}

Result<nlohmann::json> RestIngestionService::fetchJson(const std::string& target) {
    auto response = exchange(HttpRequest{HttpMethod::kGet, target, {}, {}}, kHttpOk);
    if (!response) {
        return std::unexpected(response.error());
    }
    return parseBody(response->body);
}

Result<ingest::IngestionReceipt> RestIngestionService::createIngestion(
    const ingest::IngestionBatch& batch) {
    CIDC_LOG_INFO("Registering {} files with the ingestion API", batch.fileCount());

    auto response = exchange(
        HttpRequest{HttpMethod::kPost, "/ingestion", {}, toJson(batch).dump()}, kHttpCreated);
    if (!response) {
        return std::unexpected(response.error());
    }

    auto body = parseBody(response->body);
    if (!body) {
        return std::unexpected(body.error());
    }
    auto receipt = receiptFromJson(*body);
    if (!receipt) {
        return receipt;
    }

    auto folder = response->header(kFolderPathHeader);
    if (!folder || folder->empty()) {
        return makeError<ingest::IngestionReceipt>(
            ErrorCode::kTransportError,
            fmt::format("Ingestion {} was created without a {} header", receipt->id,
                        kFolderPathHeader));
    }
    receipt->googleFolderPath = std::move(*folder);
    receipt->googleUrl = response->header(kStorageUrlHeader).value_or("");

    CIDC_LOG_DEBUG("Ingestion {} created (etag {})", receipt->id, receipt->etag);
    return receipt;
}

VoidResult RestIngestionService::patchStatus(const ingest::IngestionReceipt& receipt,
                                             const ingest::StatusUpdate& update) {
    HttpRequest request{HttpMethod::kPatch, "/ingestion/" + receipt.id, {},
                        toJson(update).dump()};
    request.headers["If-Match"] = receipt.etag;

    auto response = exchange(std::move(request), kHttpOk);
    if (!response) {
        return makeVoidError(ErrorCode::kStatusUpdateFailed,
                             fmt::format("Failed to mark ingestion {} as {}: {}", receipt.id,
                                         jobProgressToString(update.status.progress),
                                         response.error().message()));
    }
    return makeVoidSuccess();
}

Result<JobStatus> RestIngestionService::getIngestionStatus(const std::string& id) {
    auto body = fetchJson("/ingestion/" + id);
    if (!body) {
        return std::unexpected(body.error());
    }
    if (!body->contains("status")) {
        return makeError<JobStatus>(ErrorCode::kTransportError,
                                    fmt::format("Ingestion {} has no status", id));
    }
    return jobStatusFromJson(body->at("status"));
}

Result<std::vector<JobSummary>> RestIngestionService::listJobs() {
    auto body = fetchJson("/status");
    if (!body) {
        return std::unexpected(body.error());
    }
    return jobListFromJson(*body);
}

Result<TrialInfo> RestIngestionService::getTrial(const std::string& trialId) {
    auto body = fetchJson("/trials/" + trialId);
    if (!body) {
        return std::unexpected(body.error());
    }
    return trialFromJson(*body);
}

Result<AssayInfo> RestIngestionService::getAssay(const std::string& assayId) {
    auto body = fetchJson("/assays/" + assayId);
    if (!body) {
        return std::unexpected(body.error());
    }
    return assayFromJson(*body, assayId);
}

}  // namespace cidc::api
