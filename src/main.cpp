// =============================================================================
// cidc-upload - Sequencing Data Upload Client
// =============================================================================
// Main entry point for the cidc command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: login, logout, upload, jobs, track
// - Global options: api-url, session-file, log-file, verbose, quiet
// - Environment fallbacks for the API URL and session file
// =============================================================================

#include <CLI/CLI.hpp>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>

#include "cidc/common/error.h"
#include "cidc/common/logger.h"
#include "cidc/common/session.h"
#include "cidc/job/job_status_tracker.h"
#include "cidc/transfer/transfer_engine.h"

// Command implementations
#include "commands/command_support.h"
#include "commands/jobs_command.h"
#include "commands/session_commands.h"
#include "commands/upload_command.h"

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "cidc: upload sequencing runs described by a manifest to the CIDC ingestion service.\n"
    "Every sample id and file is checked locally before anything is registered or copied.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string apiUrl;
    std::string sessionFile = cidc::SessionStore::defaultPath().string();
    std::string logFile;
    int verbosity = 0;  // 0 = info, 1 = debug, 2 = trace
    bool quiet = false;
};

GlobalOptions gOptions;

// =============================================================================
// Subcommand Options
// =============================================================================

struct CliLoginOptions {
    std::string token;
    long long ttlSeconds = cidc::kDefaultSessionTtl.count();
};

CliLoginOptions gLoginOpts;

struct CliUploadOptions {
    std::string manifest;
    std::string trial;
    std::string assay;
    std::size_t parallelThreshold = cidc::transfer::kDefaultParallelThreshold;
    std::string transferTool{cidc::transfer::kDefaultTransferTool};
    long long pollInterval = cidc::job::kDefaultPollInterval.count();
    std::size_t maxPolls = cidc::job::kDefaultMaxPolls;
    bool noWait = false;
};

CliUploadOptions gUploadOpts;

struct CliJobOptions {
    std::string id;
    long long pollInterval = cidc::job::kDefaultPollInterval.count();
    std::size_t maxPolls = cidc::job::kDefaultMaxPolls;
};

CliJobOptions gJobsOpts;
CliJobOptions gTrackOpts;

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupLoginCommand(CLI::App& app) {
    auto* login = app.add_subcommand("login", "Store a bearer token for later commands");

    login->add_option("-t,--token", gLoginOpts.token, "Bearer token (JWT)")
        ->required()
        ->envname("CIDC_TOKEN");

    login->add_option("--ttl", gLoginOpts.ttlSeconds, "Session lifetime in seconds")
        ->default_val(cidc::kDefaultSessionTtl.count())
        ->check(CLI::PositiveNumber);

    app.add_subcommand("logout", "Forget the stored session");
}

void setupUploadCommand(CLI::App& app) {
    auto* upload = app.add_subcommand("upload", "Validate a manifest and upload its files");
    upload->alias("u");

    upload->add_option("-m,--manifest", gUploadOpts.manifest, "Manifest file (CSV or TSV)")
        ->required()
        ->check(CLI::ExistingFile);

    upload->add_option("--trial", gUploadOpts.trial, "Trial id")->required();

    upload->add_option("--assay", gUploadOpts.assay, "Assay id")->required();

    upload->add_option("--parallel-threshold", gUploadOpts.parallelThreshold,
                       "Copy in parallel when the batch has more files than this")
        ->default_val(cidc::transfer::kDefaultParallelThreshold)
        ->check(CLI::NonNegativeNumber);

    upload->add_option("--transfer-tool", gUploadOpts.transferTool,
                       "Bulk copy tool invoked as '<tool> [-m] cp -r <dir> <dest>'")
        ->default_val(std::string(cidc::transfer::kDefaultTransferTool));

    upload->add_option("--poll-interval", gUploadOpts.pollInterval,
                       "Seconds between job status checks")
        ->default_val(cidc::job::kDefaultPollInterval.count())
        ->check(CLI::NonNegativeNumber);

    upload->add_option("--max-polls", gUploadOpts.maxPolls,
                       "Status checks before giving up on the job")
        ->default_val(cidc::job::kDefaultMaxPolls)
        ->check(CLI::PositiveNumber);

    upload->add_flag("--no-wait", gUploadOpts.noWait,
                     "Return after the copy instead of waiting for the job");
}

void setupJobsCommand(CLI::App& app) {
    auto* jobs = app.add_subcommand("jobs", "List your upload jobs or show one");
    jobs->add_option("--id", gJobsOpts.id, "Show only this job");

    auto* track = app.add_subcommand("track", "Wait for an upload job to finish");
    track->add_option("--id", gTrackOpts.id, "Job id")->required();
    track->add_option("--poll-interval", gTrackOpts.pollInterval,
                      "Seconds between job status checks")
        ->default_val(cidc::job::kDefaultPollInterval.count())
        ->check(CLI::NonNegativeNumber);
    track->add_option("--max-polls", gTrackOpts.maxPolls,
                      "Status checks before giving up on the job")
        ->default_val(cidc::job::kDefaultMaxPolls)
        ->check(CLI::PositiveNumber);
}

[[nodiscard]] cidc::commands::ConnectionOptions connectionOptions() {
    return cidc::commands::ConnectionOptions{gOptions.apiUrl, gOptions.sessionFile};
}

}  // namespace

// =============================================================================
// Command Implementations
// =============================================================================

namespace cidc::commands {

int runLogin() {
    LoginOptions opts;
    opts.token = gLoginOpts.token;
    opts.sessionFile = gOptions.sessionFile;
    opts.ttl = std::chrono::seconds{gLoginOpts.ttlSeconds};
    return LoginCommand(std::move(opts)).execute();
}

int runUpload() {
    UploadOptions opts;
    opts.manifestPath = gUploadOpts.manifest;
    opts.trialId = gUploadOpts.trial;
    opts.assayId = gUploadOpts.assay;
    opts.parallelThreshold = gUploadOpts.parallelThreshold;
    opts.transferTool = gUploadOpts.transferTool;
    opts.pollInterval = std::chrono::seconds{gUploadOpts.pollInterval};
    opts.maxPolls = gUploadOpts.maxPolls;
    opts.wait = !gUploadOpts.noWait;
    return UploadCommand(std::move(opts), connectionOptions()).execute();
}

int runJobs() {
    return JobsCommand(gJobsOpts.id, connectionOptions()).execute();
}

int runTrack() {
    job::TrackerConfig config;
    config.pollInterval = std::chrono::seconds{gTrackOpts.pollInterval};
    config.maxPolls = gTrackOpts.maxPolls;
    return TrackCommand(gTrackOpts.id, config, connectionOptions()).execute();
}

}  // namespace cidc::commands

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    // Global options
    app.add_option("--api-url", gOptions.apiUrl, "Base URL of the ingestion API")
        ->envname("CIDC_API_URL");

    app.add_option("--session-file", gOptions.sessionFile, "Where the login session is stored")
        ->envname("CIDC_SESSION_FILE");

    app.add_option("--log-file", gOptions.logFile, "Also write logs to this file");

    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v, -vv for trace)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Only log errors");

    // Setup subcommands
    setupLoginCommand(app);
    setupUploadCommand(app);
    setupJobsCommand(app);

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    // Initialize logger
    try {
        auto config = cidc::log::Config::fromVerbosity(gOptions.verbosity, gOptions.quiet);
        config.logFile = gOptions.logFile;
        cidc::log::init(config);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    int exitCode = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("login")) {
            exitCode = cidc::commands::runLogin();
        } else if (app.got_subcommand("logout")) {
            exitCode = cidc::commands::LogoutCommand(gOptions.sessionFile).execute();
        } else if (app.got_subcommand("upload")) {
            exitCode = cidc::commands::runUpload();
        } else if (app.got_subcommand("jobs")) {
            exitCode = cidc::commands::runJobs();
        } else if (app.got_subcommand("track")) {
            exitCode = cidc::commands::runTrack();
        }
    } catch (const cidc::CidcException& ex) {
        exitCode = cidc::commands::reportFailure(cidc::Error{ex}, "Command", std::cerr);
    } catch (const std::exception& ex) {
        CIDC_LOG_CRITICAL("Unexpected error: {}", ex.what());
        std::cerr << "Unexpected error: " << ex.what() << std::endl;
        exitCode = EXIT_FAILURE;
    }

    cidc::log::shutdown();
    return exitCode;
}
