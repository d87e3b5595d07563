#pragma once

#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "core/analysis_types.hpp"
#include "database/result_store.hpp"

/**
 * @brief Where a persisted verdict can be found
 */
struct ResultReference
{
    std::string reference_key;
    bool detail_persisted = false;
    std::string detail_error; // Set when the detail write failed after the summary was stored
};

/**
 * @brief Writes a verdict through the summary and detail contracts
 *
 * The summary row is the authoritative existence marker: it is written first,
 * and the detail document is only attempted once it succeeded. A failed detail
 * write is reported in the returned reference and never rolls the summary back.
 */
class ResultAssembler
{
public:
    ResultAssembler(std::shared_ptr<SummaryStore> summary_store,
                    std::shared_ptr<DetailStore> detail_store,
                    int max_retries = 3);

    /**
     * @brief Persist a verdict for an upload
     * @throws PersistenceFailure if the summary cannot be written; no detail write is attempted then
     */
    ResultReference persist(const DetectionVerdict &verdict, const std::string &upload_reference);

    /**
     * @brief Re-attempt the detail write of an already stored summary
     * @throws PersistenceFailure if no summary exists for the key
     */
    ResultReference retryDetail(const std::string &reference_key, const DetectionVerdict &verdict);

    static SummaryRecord buildSummary(const DetectionVerdict &verdict, const std::string &upload_reference,
                                      const std::string &reference_key, const std::string &created_at);

    /**
     * @brief Nested forensic document: aggregated result, every outcome (failed and
     *        skipped included) and per-family sections for metadata, pixels and models
     */
    static nlohmann::json buildDetailDocument(const DetectionVerdict &verdict, const std::string &upload_reference,
                                              const std::string &reference_key, const std::string &created_at);

    /**
     * @brief Hex SHA-256 over the upload reference, creation time and a per-process nonce
     */
    static std::string makeReferenceKey(const std::string &upload_reference, const std::string &created_at);

private:
    DBOpResult writeDetailWithRetry(const std::string &reference_key, const nlohmann::json &document);

    std::shared_ptr<SummaryStore> summary_store_;
    std::shared_ptr<DetailStore> detail_store_;
    int max_retries_;
};
