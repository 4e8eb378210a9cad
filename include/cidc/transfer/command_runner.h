// =============================================================================
// cidc-upload - Command Runner
// =============================================================================
// Runs an external program to completion and captures its output.
//
// CommandRunner is the seam between the transfer engine and the bulk-copy
// tool; ProcessCommandRunner launches the tool with Boost.Process.
// =============================================================================

#ifndef CIDC_TRANSFER_COMMAND_RUNNER_H
#define CIDC_TRANSFER_COMMAND_RUNNER_H

#include <string>
#include <vector>

#include "cidc/common/error.h"

namespace cidc::transfer {

/// @brief Exit status and merged stdout/stderr of a finished command.
struct CommandOutput {
    int exitCode = 0;
    std::string output;

    [[nodiscard]] bool succeeded() const noexcept { return exitCode == 0; }
};

class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /// @brief Run argv[0] with the remaining arguments and wait for it.
    /// @return The command's output, or kTransferFailed if it could not start.
    [[nodiscard]] virtual Result<CommandOutput> run(const std::vector<std::string>& argv) = 0;
};

/// @brief Runs commands as child processes, resolving argv[0] on PATH.
class ProcessCommandRunner : public CommandRunner {
public:
    [[nodiscard]] Result<CommandOutput> run(const std::vector<std::string>& argv) override;
};

/// @brief Render argv for logging, quoting arguments that contain spaces.
[[nodiscard]] std::string formatCommandLine(const std::vector<std::string>& argv);

}  // namespace cidc::transfer

#endif  // CIDC_TRANSFER_COMMAND_RUNNER_H
