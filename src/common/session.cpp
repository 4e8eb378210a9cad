// =============================================================================
// cidc-upload - Session Context Implementation
// =============================================================================

#include "cidc/common/session.h"

#include <cstdlib>
#include <fstream>
#include <system_error>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "cidc/common/logger.h"

namespace cidc {

namespace {

constexpr const char* kTokenKey = "token";
constexpr const char* kObtainedAtKey = "obtained_at";
constexpr const char* kTtlKey = "ttl_seconds";

}  // namespace

SessionStore::SessionStore(std::filesystem::path path) : path_(std::move(path)) {}

std::filesystem::path SessionStore::defaultPath() {
    const char* home = std::getenv("HOME");
    std::filesystem::path base = (home != nullptr && *home != '\0') ? home : ".";
    return base / ".cidc" / "session.json";
}

Result<Session> SessionStore::load() const {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return makeError<Session>(ErrorCode::kAuthError,
                                  "Not logged in. Run 'cidc login --token <JWT>' first.");
    }

    std::ifstream in(path_);
    if (!in) {
        return makeError<Session>(ErrorCode::kIOError,
                                  fmt::format("Failed to open session file: {}", path_.string()));
    }

    nlohmann::json doc = nlohmann::json::parse(in, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object() || !doc.contains(kTokenKey) ||
        !doc[kTokenKey].is_string()) {
        return makeError<Session>(ErrorCode::kAuthError,
                                  fmt::format("Session file is corrupt: {}", path_.string()));
    }

    for (const char* key : {kObtainedAtKey, kTtlKey}) {
        if (doc.contains(key) && !doc[key].is_number_integer()) {
            return makeError<Session>(
                ErrorCode::kAuthError,
                fmt::format("Session file is corrupt: {} ('{}' is not an integer)",
                            path_.string(), key));
        }
    }

    Session session;
    session.token = doc[kTokenKey].get<std::string>();
    session.obtainedAt = Clock::time_point{
        std::chrono::seconds{doc.value(kObtainedAtKey, std::int64_t{0})}};
    session.ttl = std::chrono::seconds{doc.value(kTtlKey, kDefaultSessionTtl.count())};
    return session;
}

VoidResult SessionStore::save(const Session& session) const {
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            return makeVoidError(ErrorCode::kIOError,
                                 fmt::format("Failed to create {}: {}",
                                             path_.parent_path().string(), ec.message()));
        }
    }

    nlohmann::json doc = {
        {kTokenKey, session.token},
        {kObtainedAtKey, std::chrono::duration_cast<std::chrono::seconds>(
                             session.obtainedAt.time_since_epoch())
                             .count()},
        {kTtlKey, session.ttl.count()},
    };

    // The token grants API access: the file is emptied and made owner-only
    // before the token is written to it.
    std::ofstream out(path_, std::ios::trunc);
    if (!out) {
        return makeVoidError(ErrorCode::kIOError,
                             fmt::format("Failed to write session file: {}", path_.string()));
    }
    std::filesystem::permissions(path_,
                                 std::filesystem::perms::owner_read |
                                     std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        out.close();
        std::error_code removeEc;
        std::filesystem::remove(path_, removeEc);
        return makeVoidError(ErrorCode::kIOError,
                             fmt::format("Failed to restrict permissions on {}: {}",
                                         path_.string(), ec.message()));
    }

    out << doc.dump(2) << '\n';
    out.flush();
    if (!out) {
        return makeVoidError(ErrorCode::kIOError,
                             fmt::format("Failed to write session file: {}", path_.string()));
    }

    CIDC_LOG_DEBUG("Session saved to {}", path_.string());
    return makeVoidSuccess();
}

Result<Session> SessionStore::requireActive(Clock::time_point now) const {
    auto session = load();
    if (!session) {
        return session;
    }
    if (session->isExpired(now)) {
        return makeError<Session>(ErrorCode::kAuthError,
                                  "Session expired. Log in again with a fresh token.");
    }
    return session;
}

VoidResult SessionStore::clear() const {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        return makeVoidError(ErrorCode::kIOError,
                             fmt::format("Failed to remove {}: {}", path_.string(), ec.message()));
    }
    return makeVoidSuccess();
}

}  // namespace cidc
