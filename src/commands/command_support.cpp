// =============================================================================
// cidc-upload - Command Support Implementation
// =============================================================================

#include "command_support.h"

#include <ostream>

#include <fmt/format.h>

#include "cidc/common/logger.h"

namespace cidc::commands {

ApiConnection::ApiConnection(Token, api::Endpoint endpoint, Session session)
    : transport_(std::move(endpoint)),
      session_(std::move(session)),
      service_(transport_, session_) {}

Result<std::unique_ptr<ApiConnection>> ApiConnection::open(const ConnectionOptions& options,
                                                           Clock::time_point now) {
    if (options.apiUrl.empty()) {
        return makeError<std::unique_ptr<ApiConnection>>(
            ErrorCode::kUsageError, "No API URL configured; pass --api-url or set CIDC_API_URL");
    }

    auto endpoint = api::Endpoint::parse(options.apiUrl);
    if (!endpoint) {
        return std::unexpected(endpoint.error());
    }

    SessionStore store(options.sessionFile);
    auto session = store.requireActive(now);
    if (!session) {
        return std::unexpected(session.error());
    }

    CIDC_LOG_DEBUG("Using API {}://{}:{}{}", endpoint->scheme, endpoint->host, endpoint->port,
                   endpoint->basePath);
    return std::make_unique<ApiConnection>(Token{}, std::move(*endpoint), std::move(*session));
}

std::string_view failureHint(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kManifestFormat:
            return "The manifest header could not be read as comma- or tab-separated columns.";
        case ErrorCode::kRecordShape:
            return "Every manifest row must have as many columns as the header.";
        case ErrorCode::kSampleId:
            return "Check the sample ids against the trial; nothing was uploaded.";
        case ErrorCode::kFileNotFound:
            return "File names are resolved relative to the manifest's directory; nothing was "
                   "uploaded.";
        case ErrorCode::kUnsupportedFormat:
            return "Only recognized sequencing file types can be uploaded; nothing was uploaded.";
        case ErrorCode::kTransferFailed:
            return "The copy to storage failed and the job has been marked as aborted.";
        case ErrorCode::kTransportError:
            return "The ingestion API could not be reached or returned an unexpected response.";
        case ErrorCode::kAuthError:
            return "Log in again with 'cidc login --token <JWT>'.";
        case ErrorCode::kJobAborted:
            return "The backend aborted the job.";
        case ErrorCode::kJobTimedOut:
            return "The job may still finish; check it later with 'cidc jobs --id <id>'.";
        default:
            return {};
    }
}

int reportFailure(const Error& error, std::string_view action, std::ostream& err) {
    CIDC_LOG_ERROR("{} failed ({}): {}", action, errorCodeToString(error.code()), error.message());
    err << action << " failed: " << error.message() << '\n';
    if (const auto hint = failureHint(error.code()); !hint.empty()) {
        err << hint << '\n';
    }
    return error.exitCode();
}

std::string describeStatus(const JobStatus& status) {
    switch (status.progress) {
        case JobProgress::kInProgress:
            return "still in progress";
        case JobProgress::kCompleted:
            return "completed";
        case JobProgress::kAborted:
            return status.message.empty() ? std::string("aborted")
                                          : fmt::format("aborted: {}", status.message);
    }
    return "unknown";
}

}  // namespace cidc::commands
