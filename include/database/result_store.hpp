#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Result of a database operation
 */
struct DBOpResult
{
    bool success;
    std::string error_message;
    DBOpResult(bool s = true, const std::string &msg = "") : success(s), error_message(msg) {}
};

/**
 * @brief Per-method row of a stored detection
 */
struct MethodResultRow
{
    std::string method_name;
    std::string status; // "ok", "failed" or "skipped"
    std::optional<double> score;
    std::string reason;
    double processing_time_ms = 0.0;
};

/**
 * @brief Structured summary of one verdict as kept in the relational store
 */
struct SummaryRecord
{
    std::string reference_key;
    std::string upload_reference;
    bool is_ai_generated = false;
    double confidence_score = 0.0;
    std::string algorithm_version;
    double processing_time_ms = 0.0;
    std::string result_summary; // Contributing factors joined for display
    std::string created_at;     // UTC, ISO 8601
    std::vector<MethodResultRow> methods;
};

/**
 * @brief Relational contract. A stored summary marks a detection as existing.
 *
 * Summaries are append-only history; a reference key is never written twice.
 */
class SummaryStore
{
public:
    virtual ~SummaryStore() = default;

    /**
     * @brief Write the summary and its method rows in one transaction
     * @return DBOpResult and the reference key the row is stored under
     */
    virtual std::pair<DBOpResult, std::string> writeSummary(const SummaryRecord &record) = 0;

    virtual std::optional<SummaryRecord> readSummary(const std::string &reference_key) = 0;

    /**
     * @brief All summaries of one upload, oldest first
     */
    virtual std::vector<SummaryRecord> history(const std::string &upload_reference) = 0;
};

/**
 * @brief Document contract holding the full nested forensic detail per reference key
 */
class DetailStore
{
public:
    virtual ~DetailStore() = default;

    virtual DBOpResult writeDetail(const std::string &reference_key, const nlohmann::json &document) = 0;
    virtual std::optional<nlohmann::json> readDetail(const std::string &reference_key) = 0;
};
