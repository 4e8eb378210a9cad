// =============================================================================
// cidc-upload - Command Runner Implementation
// =============================================================================

#include "cidc/transfer/command_runner.h"

#include <istream>
#include <string>

#include <boost/filesystem/path.hpp>
#include <boost/process.hpp>
#include <fmt/format.h>

#include "cidc/common/logger.h"

namespace cidc::transfer {

namespace bp = boost::process;

std::string formatCommandLine(const std::vector<std::string>& argv) {
    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) {
            line += ' ';
        }
        if (arg.find(' ') != std::string::npos) {
            line += fmt::format("\"{}\"", arg);
        } else {
            line += arg;
        }
    }
    return line;
}

Result<CommandOutput> ProcessCommandRunner::run(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return makeError<CommandOutput>(ErrorCode::kInvalidArgument, "Empty command line");
    }

    const boost::filesystem::path executable = bp::search_path(argv.front());
    if (executable.empty()) {
        return makeError<CommandOutput>(
            ErrorCode::kTransferFailed,
            fmt::format("'{}' was not found on PATH", argv.front()));
    }

    const std::vector<std::string> args(argv.begin() + 1, argv.end());
    CIDC_LOG_INFO("Running: {}", formatCommandLine(argv));

    try {
        bp::ipstream pipe;
        bp::child child(executable, bp::args(args), (bp::std_out & bp::std_err) > pipe);

        CommandOutput result;
        std::string line;
        while (std::getline(pipe, line)) {
            CIDC_LOG_DEBUG("[{}] {}", argv.front(), line);
            result.output += line;
            result.output += '\n';
        }
        child.wait();
        result.exitCode = child.exit_code();

        CIDC_LOG_DEBUG("{} exited with status {}", argv.front(), result.exitCode);
        return result;
    } catch (const bp::process_error& e) {
        return makeError<CommandOutput>(
            ErrorCode::kTransferFailed,
            fmt::format("Failed to run '{}': {}", argv.front(), e.what()));
    }
}

}  // namespace cidc::transfer
