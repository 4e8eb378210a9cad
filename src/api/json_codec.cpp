// =============================================================================
// cidc-upload - JSON Codec Implementation
// =============================================================================

#include "cidc/api/json_codec.h"

#include <fmt/format.h>

namespace cidc::api {

using nlohmann::json;

namespace {

template <typename T>
Result<T> malformed(std::string_view what, std::string_view detail) {
    return makeError<T>(ErrorCode::kTransportError,
                        fmt::format("Malformed {} in API response: {}", what, detail));
}

/// Read a string member that may be absent.
std::string stringOr(const json& object, const char* key, std::string fallback = {}) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

json pairingToJson(const ingest::PairingInfo& pairing) {
    return json{
        {"patient_id", pairing.patientId},
        {"timepoint", pairing.timepoint},
        {"timepoint_unit", pairing.timepointUnit},
        {"batch_id", pairing.batchId},
        {"instrument_model", pairing.instrumentModel},
        {"read_length", pairing.readLength},
        {"avg_insert_size", pairing.insertSize},
        {"sample_id", pairing.sampleId},
        {"sample_type", pairing.tumorNormal},
        {"pair_label", pairing.pairLabel},
    };
}

}  // namespace

// =============================================================================
// Encoding
// =============================================================================

json toJson(const JobStatus& status) {
    return json{{"progress", std::string(jobProgressToString(status.progress))},
                {"message", status.message}};
}

json toJson(const ingest::FileSubmission& file) {
    json out{
        {"assay", file.assayId},
        {"experimental_strategy", file.assayName},
        {"file_name", file.fileName},
        {"mapping", file.mapping},
        {"number_of_samples", file.numberOfSamples()},
        {"sample_ids", file.sampleIds},
        {"trial", file.trialId},
        {"trial_name", file.trialName},
        {"fastq_properties", pairingToJson(file.pairing)},
    };
    out["data_format"] = file.dataFormat ? json(*file.dataFormat) : json(nullptr);
    out["file_size"] = file.fileSize ? json(*file.fileSize) : json(nullptr);
    return out;
}

json toJson(const ingest::IngestionBatch& batch) {
    json files = json::array();
    for (const auto& file : batch.files()) {
        files.push_back(toJson(file));
    }
    return json{
        {"number_of_files", batch.fileCount()},
        {"status", {{"progress", std::string(jobProgressToString(batch.status().progress))}}},
        {"files", std::move(files)},
    };
}

json toJson(const ingest::StatusUpdate& update) {
    json out{{"status", toJson(update.status)}};
    if (update.endTime) {
        out["end_time"] = *update.endTime;
    }
    return out;
}

// =============================================================================
// Decoding
// =============================================================================

Result<json> parseBody(const std::string& body) {
    json parsed = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) {
        return malformed<json>("document", "body is not valid JSON");
    }
    return parsed;
}

Result<JobStatus> jobStatusFromJson(const json& object) {
    if (!object.is_object()) {
        return malformed<JobStatus>("status", "expected an object");
    }
    const std::string progress = stringOr(object, "progress");
    const auto parsed = jobProgressFromString(progress);
    if (!parsed) {
        return malformed<JobStatus>("status", fmt::format("unknown progress '{}'", progress));
    }
    return JobStatus{*parsed, stringOr(object, "message")};
}

Result<ingest::IngestionReceipt> receiptFromJson(const json& object) {
    if (!object.is_object()) {
        return malformed<ingest::IngestionReceipt>("ingestion record", "expected an object");
    }
    ingest::IngestionReceipt receipt;
    receipt.id = stringOr(object, "_id");
    receipt.etag = stringOr(object, "_etag");
    if (receipt.id.empty() || receipt.etag.empty()) {
        return malformed<ingest::IngestionReceipt>("ingestion record", "missing _id or _etag");
    }
    return receipt;
}

Result<TrialInfo> trialFromJson(const json& object) {
    if (!object.is_object()) {
        return malformed<TrialInfo>("trial", "expected an object");
    }
    TrialInfo info;
    info.trial.id = stringOr(object, "_id");
    info.trial.name = stringOr(object, "trial_name");
    if (info.trial.id.empty()) {
        return malformed<TrialInfo>("trial", "missing _id");
    }

    if (auto it = object.find("samples"); it != object.end() && it->is_array()) {
        for (const auto& sample : *it) {
            if (sample.is_string()) {
                info.trial.sampleIds.insert(sample.get<std::string>());
            }
        }
    }
    if (auto it = object.find("assays"); it != object.end() && it->is_array()) {
        for (const auto& assay : *it) {
            if (!assay.is_object()) {
                continue;
            }
            info.assays.push_back(
                AssaySelection{stringOr(assay, "assay_id"), stringOr(assay, "assay_name")});
        }
    }
    return info;
}

Result<AssayInfo> assayFromJson(const json& object, const std::string& requestedId) {
    if (!object.is_object()) {
        return malformed<AssayInfo>("assay", "expected an object");
    }
    AssayInfo info;
    info.assay.id = stringOr(object, "assay_id", stringOr(object, "_id", requestedId));
    info.assay.name = stringOr(object, "assay_name");

    auto it = object.find("non_static_inputs");
    if (it == object.end() || !it->is_array()) {
        return malformed<AssayInfo>("assay", "missing non_static_inputs");
    }
    for (const auto& input : *it) {
        if (input.is_string()) {
            info.nonStaticInputs.insert(input.get<std::string>());
        }
    }
    return info;
}

Result<std::vector<JobSummary>> jobListFromJson(const json& object) {
    auto items = object.find("_items");
    if (!object.is_object() || items == object.end() || !items->is_array()) {
        return malformed<std::vector<JobSummary>>("job list", "missing _items");
    }

    std::vector<JobSummary> jobs;
    jobs.reserve(items->size());
    for (const auto& item : *items) {
        if (!item.is_object() || !item.contains("status")) {
            return malformed<std::vector<JobSummary>>("job list", "entry without status");
        }
        auto status = jobStatusFromJson(item.at("status"));
        if (!status) {
            return std::unexpected(status.error());
        }
        jobs.push_back(JobSummary{stringOr(item, "_id"), std::move(*status),
                                  stringOr(item, "start_time", stringOr(item, "_created"))});
    }
    return jobs;
}

}  // namespace cidc::api
