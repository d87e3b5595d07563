#include "core/result_assembler.hpp"
#include "core/detection_errors.hpp"
#include "core/error_recovery.hpp"
#include "logging/logger.hpp"
#include <openssl/sha.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace
{
    const std::vector<std::string> kPixelMethods = {"prnu", "ela", "texture"};

    std::string utcTimestamp()
    {
        const auto now = std::chrono::system_clock::now();
        const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm tm{};
        gmtime_r(&seconds, &tm);
        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "." << std::setw(3) << std::setfill('0') << millis << "Z";
        return ss.str();
    }

    std::string joinFactors(const std::vector<std::string> &factors)
    {
        std::string joined;
        for (const auto &factor : factors)
        {
            if (!joined.empty())
                joined += " | ";
            joined += factor;
        }
        return joined;
    }
}

ResultAssembler::ResultAssembler(std::shared_ptr<SummaryStore> summary_store,
                                 std::shared_ptr<DetailStore> detail_store,
                                 int max_retries)
    : summary_store_(std::move(summary_store)),
      detail_store_(std::move(detail_store)),
      max_retries_(max_retries)
{
    if (!summary_store_ || !detail_store_)
    {
        throw ConfigurationError("ResultAssembler requires both a summary and a detail store");
    }
}

ResultReference ResultAssembler::persist(const DetectionVerdict &verdict, const std::string &upload_reference)
{
    const std::string created_at = utcTimestamp();
    const std::string key = makeReferenceKey(upload_reference, created_at);
    const SummaryRecord record = buildSummary(verdict, upload_reference, key, created_at);

    ResultReference reference;
    try
    {
        reference.reference_key = ErrorRecovery::retryWithBackoff(
            [this, &record]()
            {
                auto [result, stored_key] = summary_store_->writeSummary(record);
                if (!result.success)
                {
                    throw PersistenceFailure("summary write failed: " + result.error_message);
                }
                return stored_key;
            },
            max_retries_, "writeSummary " + key);
    }
    catch (const PersistenceFailure &e)
    {
        Logger::error("Persisting verdict for upload " + upload_reference + " failed: " + e.what());
        throw;
    }

    Logger::info("Stored summary " + reference.reference_key + " for upload " + upload_reference);

    const auto detail = writeDetailWithRetry(reference.reference_key,
                                             buildDetailDocument(verdict, upload_reference, reference.reference_key, created_at));
    reference.detail_persisted = detail.success;
    if (!detail.success)
    {
        reference.detail_error = detail.error_message;
        Logger::error("Detail document for " + reference.reference_key + " not stored (summary kept): " + detail.error_message);
    }
    return reference;
}

ResultReference ResultAssembler::retryDetail(const std::string &reference_key, const DetectionVerdict &verdict)
{
    auto summary = summary_store_->readSummary(reference_key);
    if (!summary)
    {
        throw PersistenceFailure("no stored summary for reference " + reference_key);
    }

    ResultReference reference;
    reference.reference_key = reference_key;
    const auto detail = writeDetailWithRetry(reference_key,
                                             buildDetailDocument(verdict, summary->upload_reference, reference_key, summary->created_at));
    reference.detail_persisted = detail.success;
    if (!detail.success)
    {
        reference.detail_error = detail.error_message;
        Logger::error("Retry of detail document " + reference_key + " failed: " + detail.error_message);
    }
    else
    {
        Logger::info("Detail document " + reference_key + " stored on retry");
    }
    return reference;
}

DBOpResult ResultAssembler::writeDetailWithRetry(const std::string &reference_key, const nlohmann::json &document)
{
    try
    {
        ErrorRecovery::retryWithBackoff(
            [this, &reference_key, &document]()
            {
                auto result = detail_store_->writeDetail(reference_key, document);
                if (!result.success)
                {
                    throw PersistenceFailure(result.error_message);
                }
                return true;
            },
            max_retries_, "writeDetail " + reference_key);
    }
    catch (const PersistenceFailure &e)
    {
        return DBOpResult(false, e.what());
    }
    catch (const std::exception &e)
    {
        // e.g. a document that cannot be serialized; the summary is already committed
        return DBOpResult(false, std::string("detail document rejected: ") + e.what());
    }
    return DBOpResult(true);
}

SummaryRecord ResultAssembler::buildSummary(const DetectionVerdict &verdict, const std::string &upload_reference,
                                            const std::string &reference_key, const std::string &created_at)
{
    SummaryRecord record;
    record.reference_key = reference_key;
    record.upload_reference = upload_reference;
    record.is_ai_generated = verdict.isAiGenerated();
    record.confidence_score = verdict.confidenceScore();
    record.algorithm_version = verdict.algorithmVersion();
    record.processing_time_ms = verdict.processingTimeMs();
    record.result_summary = joinFactors(verdict.contributingFactors());
    record.created_at = created_at;
    for (const auto &outcome : verdict.methodOutcomes())
    {
        MethodResultRow row;
        row.method_name = outcome.method_name;
        row.status = methodStatusName(outcome.status);
        row.score = outcome.score;
        row.reason = outcome.reason;
        row.processing_time_ms = outcome.processing_time_ms;
        record.methods.push_back(std::move(row));
    }
    return record;
}

nlohmann::json ResultAssembler::buildDetailDocument(const DetectionVerdict &verdict, const std::string &upload_reference,
                                                    const std::string &reference_key, const std::string &created_at)
{
    nlohmann::json document;
    document["reference_key"] = reference_key;
    document["upload_reference"] = upload_reference;
    document["created_at"] = created_at;
    document["algorithm_version"] = verdict.algorithmVersion();
    document["aggregated_results"] = {
        {"is_ai_generated", verdict.isAiGenerated()},
        {"confidence_score", verdict.confidenceScore()},
        {"contributing_factors", verdict.contributingFactors()},
        {"processing_time_ms", verdict.processingTimeMs()}};

    nlohmann::json method_outcomes = nlohmann::json::array();
    nlohmann::json pixel_analysis = nlohmann::json::object();
    nlohmann::json model_results = nlohmann::json::object();
    nlohmann::json exif_data = nlohmann::json::object();
    nlohmann::json ela_image_path = nullptr;

    for (const auto &outcome : verdict.methodOutcomes())
    {
        nlohmann::json entry = outcomeToJson(outcome);
        method_outcomes.push_back(entry);

        if (outcome.method_name == "metadata")
        {
            exif_data = entry;
        }
        else if (std::find(kPixelMethods.begin(), kPixelMethods.end(), outcome.method_name) != kPixelMethods.end())
        {
            pixel_analysis[outcome.method_name] = entry;
            if (outcome.method_name == "ela" && outcome.detail.contains("artifact_path"))
                ela_image_path = outcome.detail.at("artifact_path");
        }
        else
        {
            model_results[outcome.method_name] = entry;
        }
    }

    document["method_outcomes"] = method_outcomes;
    document["exif_data"] = exif_data;
    pixel_analysis["ela_image_path"] = ela_image_path;
    document["pixel_analysis"] = pixel_analysis;
    document["model_results"] = model_results;
    return document;
}

std::string ResultAssembler::makeReferenceKey(const std::string &upload_reference, const std::string &created_at)
{
    static std::atomic<unsigned long long> counter{0};
    static const unsigned long long process_salt = std::random_device{}();

    const std::string material = upload_reference + "|" + created_at + "|" +
                                 std::to_string(process_salt) + "|" + std::to_string(++counter);

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_CTX sha256;
    if (SHA256_Init(&sha256) != 1 ||
        SHA256_Update(&sha256, material.data(), material.size()) != 1 ||
        SHA256_Final(hash, &sha256) != 1)
    {
        throw PersistenceFailure("failed to compute reference key");
    }

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i)
    {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}
