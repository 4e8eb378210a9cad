// =============================================================================
// cidc-upload - Command Support
// =============================================================================
// Pieces shared by the command handlers:
// - ConnectionOptions / ApiConnection: session + transport + REST client
// - reportFailure(): turn an Error into user text and an exit code
// - describeStatus(): plain-language rendering of a job status
// =============================================================================

#ifndef CIDC_COMMANDS_COMMAND_SUPPORT_H
#define CIDC_COMMANDS_COMMAND_SUPPORT_H

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>

#include "cidc/api/http_transport.h"
#include "cidc/api/ingestion_service.h"
#include "cidc/common/error.h"
#include "cidc/common/session.h"
#include "cidc/common/types.h"

namespace cidc::commands {

/// @brief Global options every networked command needs.
struct ConnectionOptions {
    /// @brief Base URL of the ingestion API.
    std::string apiUrl;

    std::filesystem::path sessionFile;
};

/// @brief Owns the transport and the REST client for one invocation.
class ApiConnection {
    struct Token {
        explicit Token() = default;
    };

public:
    /// @brief Load an unexpired session and connect to the configured API.
    [[nodiscard]] static Result<std::unique_ptr<ApiConnection>> open(
        const ConnectionOptions& options, Clock::time_point now);

    /// @brief Only open() can name the token.
    ApiConnection(Token token, api::Endpoint endpoint, Session session);

    ApiConnection(const ApiConnection&) = delete;
    ApiConnection& operator=(const ApiConnection&) = delete;

    [[nodiscard]] api::IngestionService& service() noexcept { return service_; }

    [[nodiscard]] const Session& session() const noexcept { return session_; }

private:
    api::BeastTransport transport_;
    Session session_;
    api::RestIngestionService service_;
};

/// @brief One sentence telling the user what a failure category means.
[[nodiscard]] std::string_view failureHint(ErrorCode code) noexcept;

/// @brief Log the error, print it with its hint to err, return its exit code.
int reportFailure(const Error& error, std::string_view action, std::ostream& err);

/// @brief "still in progress", "completed" or "aborted: <message>".
[[nodiscard]] std::string describeStatus(const JobStatus& status);

}  // namespace cidc::commands

#endif  // CIDC_COMMANDS_COMMAND_SUPPORT_H
