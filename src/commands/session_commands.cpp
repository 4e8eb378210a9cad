// =============================================================================
// cidc-upload - Session Commands Implementation
// =============================================================================

#include "session_commands.h"

#include <fmt/format.h>

#include "cidc/common/logger.h"
#include "cidc/ingest/submission.h"
#include "command_support.h"

namespace cidc::commands {

LoginCommand::LoginCommand(LoginOptions options, std::ostream& out, std::ostream& err)
    : options_(std::move(options)), out_(out), err_(err) {}

int LoginCommand::execute(Clock::time_point now) {
    if (options_.token.empty()) {
        return reportFailure(Error{ErrorCode::kUsageError, "The token must not be empty"},
                             "Login", err_);
    }

    const Session session{options_.token, now, options_.ttl};
    SessionStore store(options_.sessionFile);
    if (auto saved = store.save(session); !saved) {
        return reportFailure(saved.error(), "Login", err_);
    }

    CIDC_LOG_INFO("Session stored in {}", store.path().string());
    out_ << fmt::format("Logged in. The session is valid until {}.\n",
                        ingest::toIsoTimestamp(session.expiresAt()));
    return toExitCode(ErrorCode::kSuccess);
}

LogoutCommand::LogoutCommand(std::filesystem::path sessionFile, std::ostream& out,
                             std::ostream& err)
    : sessionFile_(std::move(sessionFile)), out_(out), err_(err) {}

int LogoutCommand::execute() {
    SessionStore store(sessionFile_);
    if (auto cleared = store.clear(); !cleared) {
        return reportFailure(cleared.error(), "Logout", err_);
    }
    out_ << "Logged out.\n";
    return toExitCode(ErrorCode::kSuccess);
}

}  // namespace cidc::commands
