// =============================================================================
// cidc-upload - Test Support
// =============================================================================
// In-memory fakes for the network and process seams, plus helpers for
// building manifests in temporary directories.
// =============================================================================

#ifndef CIDC_TESTS_SUPPORT_TEST_SUPPORT_H
#define CIDC_TESTS_SUPPORT_TEST_SUPPORT_H

#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <random>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "cidc/api/http_transport.h"
#include "cidc/api/ingestion_service.h"
#include "cidc/common/error.h"
#include "cidc/common/types.h"
#include "cidc/job/job_status_tracker.h"
#include "cidc/transfer/command_runner.h"

namespace cidc::test {

// =============================================================================
// Temporary Directory
// =============================================================================

/// @brief Directory removed with its contents on destruction.
class TempDir {
public:
    TempDir() {
        static std::atomic<unsigned> counter{0};
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("cidc-test-" + std::to_string(rd()) + "-" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    std::filesystem::path writeFile(const std::string& name, const std::string& content) const {
        auto file = path_ / name;
        std::ofstream out(file, std::ios::binary);
        out << content;
        return file;
    }

private:
    std::filesystem::path path_;
};

// =============================================================================
// Manifest Builders
// =============================================================================

/// @brief A complete 13-column manifest header.
inline std::vector<std::string> standardHeader() {
    return {std::string(kColSampleId),      std::string(kColPatientId),
            std::string(kColTimepoint),     std::string(kColTimepointUnit),
            std::string(kColBatchId),       std::string(kColInstrumentModel),
            std::string(kColReadLength),    std::string(kColAvgInsertSize),
            std::string(kColFastqTumor1),   std::string(kColFastqTumor2),
            std::string(kColFastqNormal1),  std::string(kColFastqNormal2),
            "COMMENTS"};
}

/// @brief A data row matching standardHeader() for one sample.
inline std::vector<std::string> standardRow(const std::string& sampleId) {
    return {sampleId,
            "PT-" + sampleId,
            "1",
            "day",
            "B1",
            "HiSeq",
            "150",
            "300",
            sampleId + "_T_R1.fq.gz",
            sampleId + "_T_R2.fq.gz",
            sampleId + "_N_R1.fq.gz",
            sampleId + "_N_R2.fq.gz",
            ""};
}

inline std::string joinRow(const std::vector<std::string>& cells, char delimiter) {
    std::string line;
    for (std::size_t i = 0; i < cells.size(); ++i) {
        if (i > 0) {
            line += delimiter;
        }
        line += cells[i];
    }
    return line;
}

inline std::string buildManifest(const std::vector<std::string>& header,
                                 const std::vector<std::vector<std::string>>& rows,
                                 char delimiter = ',') {
    std::ostringstream oss;
    oss << joinRow(header, delimiter) << '\n';
    for (const auto& row : rows) {
        oss << joinRow(row, delimiter) << '\n';
    }
    return oss.str();
}

/// @brief Non-static inputs of a paired tumor/normal FASTQ assay.
inline std::set<std::string, std::less<>> fastqInputs() {
    return {std::string(kColFastqTumor1), std::string(kColFastqTumor2),
            std::string(kColFastqNormal1), std::string(kColFastqNormal2)};
}

// =============================================================================
// Fake Transport
// =============================================================================

class FakeTransport : public api::HttpTransport {
public:
    Result<api::HttpResponse> send(const api::HttpRequest& request) override {
        requests.push_back(request);
        if (responses.empty()) {
            return makeError<api::HttpResponse>(ErrorCode::kTransportError, "no response queued");
        }
        auto next = std::move(responses.front());
        responses.pop_front();
        return next;
    }

    void respond(unsigned status, std::string body,
                 std::map<std::string, std::string> headers = {}) {
        responses.push_back(api::HttpResponse{status, std::move(headers), std::move(body)});
    }

    void fail(std::string message) {
        responses.push_back(makeError<api::HttpResponse>(ErrorCode::kTransportError,
                                                         std::move(message)));
    }

    std::deque<Result<api::HttpResponse>> responses;
    std::vector<api::HttpRequest> requests;
};

// =============================================================================
// Fake Ingestion Service
// =============================================================================

class FakeIngestionService : public api::IngestionService {
public:
    Result<ingest::IngestionReceipt> createIngestion(const ingest::IngestionBatch& batch) override {
        ++createCalls;
        createdBatches.push_back(batch);
        if (createError) {
            return std::unexpected(*createError);
        }
        return receipt;
    }

    VoidResult patchStatus(const ingest::IngestionReceipt& patched,
                           const ingest::StatusUpdate& update) override {
        patchedIds.push_back(patched.id);
        patches.push_back(update);
        if (patchError) {
            return std::unexpected(*patchError);
        }
        return makeVoidSuccess();
    }

    Result<JobStatus> getIngestionStatus(const std::string& id) override {
        ++statusCalls;
        polledIds.push_back(id);
        if (statuses.empty()) {
            return fallbackStatus;
        }
        auto next = std::move(statuses.front());
        statuses.pop_front();
        return next;
    }

    Result<std::vector<api::JobSummary>> listJobs() override { return jobs; }

    Result<api::TrialInfo> getTrial(const std::string& trialId) override {
        requestedTrials.push_back(trialId);
        if (trialError) {
            return std::unexpected(*trialError);
        }
        return trial;
    }

    Result<api::AssayInfo> getAssay(const std::string& assayId) override {
        requestedAssays.push_back(assayId);
        if (assayError) {
            return std::unexpected(*assayError);
        }
        return assay;
    }

    // Scripted behaviour
    api::TrialInfo trial;
    api::AssayInfo assay;
    ingest::IngestionReceipt receipt{"ing-1", "etag-1", "trial-1/run", ""};
    std::deque<Result<JobStatus>> statuses;
    JobStatus fallbackStatus = JobStatus::inProgress();
    std::vector<api::JobSummary> jobs;
    std::optional<Error> trialError;
    std::optional<Error> assayError;
    std::optional<Error> createError;
    std::optional<Error> patchError;

    // Recorded calls
    std::size_t createCalls = 0;
    std::size_t statusCalls = 0;
    std::vector<ingest::IngestionBatch> createdBatches;
    std::vector<ingest::StatusUpdate> patches;
    std::vector<std::string> patchedIds;
    std::vector<std::string> polledIds;
    std::vector<std::string> requestedTrials;
    std::vector<std::string> requestedAssays;
};

// =============================================================================
// Fake Command Runner
// =============================================================================

class FakeCommandRunner : public transfer::CommandRunner {
public:
    Result<transfer::CommandOutput> run(const std::vector<std::string>& argv) override {
        commands.push_back(argv);
        if (launchError) {
            return std::unexpected(*launchError);
        }
        return output;
    }

    transfer::CommandOutput output;
    std::optional<Error> launchError;
    std::vector<std::vector<std::string>> commands;
};

// =============================================================================
// Recording Sleeper
// =============================================================================

/// @brief Sleeper that records requested durations instead of sleeping.
inline job::Sleeper recordingSleeper(std::vector<std::chrono::seconds>& sleeps) {
    return [&sleeps](std::chrono::seconds duration) { sleeps.push_back(duration); };
}

}  // namespace cidc::test

#endif  // CIDC_TESTS_SUPPORT_TEST_SUPPORT_H
