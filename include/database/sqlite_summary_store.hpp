#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "database/result_store.hpp"
#include "database/sqlite_connection.hpp"

/**
 * @brief SummaryStore on SQLite: detection_results plus method_results rows
 */
class SqliteSummaryStore : public SummaryStore
{
public:
    /**
     * @brief Open the database and create the schema; failures are logged and
     *        reported by every later write
     */
    explicit SqliteSummaryStore(const std::string &db_path);

    std::pair<DBOpResult, std::string> writeSummary(const SummaryRecord &record) override;
    std::optional<SummaryRecord> readSummary(const std::string &reference_key) override;
    std::vector<SummaryRecord> history(const std::string &upload_reference) override;

    bool isReady() const { return ready_; }

private:
    DBOpResult insertSummary(const SummaryRecord &record);
    DBOpResult insertMethodRow(const std::string &reference_key, const MethodResultRow &row);
    std::vector<MethodResultRow> readMethodRows(const std::string &reference_key);
    std::vector<SummaryRecord> querySummaries(const std::string &sql, const std::string &param);

    std::mutex mutex_;
    SqliteConnection connection_;
    bool ready_ = false;
};
