// =============================================================================
// cidc-upload - Session Context
// =============================================================================
// Explicit authentication context threaded into every component that talks
// to the ingestion API.
//
// This module provides:
// - Session: bearer token plus the time it was obtained and its lifetime
// - SessionStore: JSON persistence of the session between invocations
//
// A session is valid for a fixed lifetime after login; every command checks
// expiry against the wall clock before issuing a request.
// =============================================================================

#ifndef CIDC_COMMON_SESSION_H
#define CIDC_COMMON_SESSION_H

#include <chrono>
#include <filesystem>
#include <string>

#include "cidc/common/error.h"

namespace cidc {

/// @brief Default lifetime of a stored login.
inline constexpr std::chrono::seconds kDefaultSessionTtl{600};

using Clock = std::chrono::system_clock;

// =============================================================================
// Session
// =============================================================================

/// @brief Authentication context for one user.
struct Session {
    /// @brief Bearer token issued by the web portal.
    std::string token;

    /// @brief When the token was stored.
    Clock::time_point obtainedAt{};

    /// @brief How long the token is trusted after obtainedAt.
    std::chrono::seconds ttl = kDefaultSessionTtl;

    [[nodiscard]] Clock::time_point expiresAt() const noexcept { return obtainedAt + ttl; }

    [[nodiscard]] bool isExpired(Clock::time_point now) const noexcept {
        return token.empty() || now >= expiresAt();
    }

    /// @brief Value for the HTTP Authorization header.
    [[nodiscard]] std::string authorizationHeader() const { return "Bearer " + token; }
};

// =============================================================================
// SessionStore
// =============================================================================

/// @brief Loads and saves a Session as a small JSON document.
class SessionStore {
public:
    explicit SessionStore(std::filesystem::path path);

    /// @brief $HOME/.cidc/session.json (current directory when HOME is unset).
    [[nodiscard]] static std::filesystem::path defaultPath();

    /// @brief Read the stored session.
    /// @return AuthError when no session has been stored, IOError when unreadable.
    [[nodiscard]] Result<Session> load() const;

    /// @brief Persist a session, creating parent directories as needed.
    [[nodiscard]] VoidResult save(const Session& session) const;

    /// @brief Load the session and reject it when expired.
    [[nodiscard]] Result<Session> requireActive(Clock::time_point now) const;

    /// @brief Remove the stored session (no error when absent).
    [[nodiscard]] VoidResult clear() const;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace cidc

#endif  // CIDC_COMMON_SESSION_H
