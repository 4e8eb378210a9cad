// =============================================================================
// cidc-upload - Session Commands
// =============================================================================
// Command handlers for "cidc login" and "cidc logout".
// =============================================================================

#ifndef CIDC_COMMANDS_SESSION_COMMANDS_H
#define CIDC_COMMANDS_SESSION_COMMANDS_H

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

#include "cidc/common/session.h"

namespace cidc::commands {

struct LoginOptions {
    /// @brief Bearer token issued by the identity provider.
    std::string token;

    std::filesystem::path sessionFile;

    std::chrono::seconds ttl = kDefaultSessionTtl;
};

class LoginCommand {
public:
    explicit LoginCommand(LoginOptions options, std::ostream& out = std::cout,
                          std::ostream& err = std::cerr);

    /// @brief Store a new session starting at now.
    [[nodiscard]] int execute(Clock::time_point now = Clock::now());

private:
    LoginOptions options_;
    std::ostream& out_;
    std::ostream& err_;
};

class LogoutCommand {
public:
    explicit LogoutCommand(std::filesystem::path sessionFile, std::ostream& out = std::cout,
                           std::ostream& err = std::cerr);

    [[nodiscard]] int execute();

private:
    std::filesystem::path sessionFile_;
    std::ostream& out_;
    std::ostream& err_;
};

}  // namespace cidc::commands

#endif  // CIDC_COMMANDS_SESSION_COMMANDS_H
