#include "database/sqlite_summary_store.hpp"
#include "database/sql_scripts.hpp"
#include "logging/logger.hpp"

namespace
{
    std::string columnText(sqlite3_stmt *stmt, int column)
    {
        const unsigned char *text = sqlite3_column_text(stmt, column);
        return text ? reinterpret_cast<const char *>(text) : std::string();
    }
}

SqliteSummaryStore::SqliteSummaryStore(const std::string &db_path)
{
    if (!connection_.open(db_path).success)
        return;

    for (const auto &script : {DatabaseScripts::CREATE_DETECTION_RESULTS_TABLE,
                               DatabaseScripts::CREATE_METHOD_RESULTS_TABLE,
                               DatabaseScripts::CREATE_SUMMARY_INDEXES})
    {
        auto result = connection_.exec(script);
        if (!result.success)
        {
            Logger::error("Failed to create summary schema in " + db_path + ": " + result.error_message);
            return;
        }
    }
    ready_ = true;
    Logger::info("Summary store ready: " + db_path);
}

std::pair<DBOpResult, std::string> SqliteSummaryStore::writeSummary(const SummaryRecord &record)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ready_)
    {
        return {DBOpResult(false, "Summary store not initialized"), ""};
    }
    if (record.reference_key.empty())
    {
        return {DBOpResult(false, "Summary record has no reference key"), ""};
    }

    auto begin = connection_.exec("BEGIN IMMEDIATE TRANSACTION;");
    if (!begin.success)
    {
        return {begin, ""};
    }

    DBOpResult result = insertSummary(record);
    for (size_t i = 0; result.success && i < record.methods.size(); ++i)
    {
        result = insertMethodRow(record.reference_key, record.methods[i]);
    }

    if (!result.success)
    {
        auto rollback = connection_.exec("ROLLBACK;");
        if (!rollback.success)
        {
            Logger::error("Rollback failed: " + rollback.error_message);
        }
        Logger::error("Failed to write summary " + record.reference_key + ": " + result.error_message);
        return {result, ""};
    }

    auto commit = connection_.exec("COMMIT;");
    if (!commit.success)
    {
        auto rollback = connection_.exec("ROLLBACK;");
        if (!rollback.success)
        {
            Logger::error("Rollback failed: " + rollback.error_message);
        }
        Logger::error("Failed to commit summary " + record.reference_key + ": " + commit.error_message);
        return {commit, ""};
    }

    Logger::debug("Stored summary " + record.reference_key + " with " + std::to_string(record.methods.size()) + " method rows");
    return {DBOpResult(true), record.reference_key};
}

DBOpResult SqliteSummaryStore::insertSummary(const SummaryRecord &record)
{
    const std::string insert_sql = R"(
        INSERT INTO detection_results
        (reference_key, upload_reference, is_ai_generated, confidence_score,
         algorithm_version, processing_time_ms, result_summary, created_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?)
    )";

    StatementGuard stmt;
    if (sqlite3_prepare_v2(connection_.handle(), insert_sql.c_str(), -1, stmt.out(), nullptr) != SQLITE_OK)
    {
        return DBOpResult(false, "Failed to prepare statement: " + connection_.lastError());
    }

    sqlite3_bind_text(stmt.get(), 1, record.reference_key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, record.upload_reference.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt.get(), 3, record.is_ai_generated ? 1 : 0);
    sqlite3_bind_double(stmt.get(), 4, record.confidence_score);
    sqlite3_bind_text(stmt.get(), 5, record.algorithm_version.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt.get(), 6, record.processing_time_ms);
    sqlite3_bind_text(stmt.get(), 7, record.result_summary.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 8, record.created_at.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    {
        return DBOpResult(false, "Failed to insert detection result: " + connection_.lastError());
    }
    return DBOpResult(true);
}

DBOpResult SqliteSummaryStore::insertMethodRow(const std::string &reference_key, const MethodResultRow &row)
{
    const std::string insert_sql = R"(
        INSERT INTO method_results
        (reference_key, method_name, status, score, reason, processing_time_ms)
        VALUES (?, ?, ?, ?, ?, ?)
    )";

    StatementGuard stmt;
    if (sqlite3_prepare_v2(connection_.handle(), insert_sql.c_str(), -1, stmt.out(), nullptr) != SQLITE_OK)
    {
        return DBOpResult(false, "Failed to prepare statement: " + connection_.lastError());
    }

    sqlite3_bind_text(stmt.get(), 1, reference_key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, row.method_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 3, row.status.c_str(), -1, SQLITE_TRANSIENT);
    if (row.score)
        sqlite3_bind_double(stmt.get(), 4, *row.score);
    else
        sqlite3_bind_null(stmt.get(), 4);
    if (row.reason.empty())
        sqlite3_bind_null(stmt.get(), 5);
    else
        sqlite3_bind_text(stmt.get(), 5, row.reason.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt.get(), 6, row.processing_time_ms);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    {
        return DBOpResult(false, "Failed to insert method result " + row.method_name + ": " + connection_.lastError());
    }
    return DBOpResult(true);
}

std::optional<SummaryRecord> SqliteSummaryStore::readSummary(const std::string &reference_key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto records = querySummaries(R"(
        SELECT reference_key, upload_reference, is_ai_generated, confidence_score,
               algorithm_version, processing_time_ms, result_summary, created_at
        FROM detection_results WHERE reference_key = ?
    )",
                                  reference_key);
    if (records.empty())
        return std::nullopt;
    return records.front();
}

std::vector<SummaryRecord> SqliteSummaryStore::history(const std::string &upload_reference)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return querySummaries(R"(
        SELECT reference_key, upload_reference, is_ai_generated, confidence_score,
               algorithm_version, processing_time_ms, result_summary, created_at
        FROM detection_results WHERE upload_reference = ?
        ORDER BY created_at ASC, rowid ASC
    )",
                          upload_reference);
}

std::vector<SummaryRecord> SqliteSummaryStore::querySummaries(const std::string &sql, const std::string &param)
{
    std::vector<SummaryRecord> records;
    if (!ready_)
        return records;

    {
        StatementGuard stmt;
        if (sqlite3_prepare_v2(connection_.handle(), sql.c_str(), -1, stmt.out(), nullptr) != SQLITE_OK)
        {
            Logger::error("Failed to prepare summary query: " + connection_.lastError());
            return records;
        }
        sqlite3_bind_text(stmt.get(), 1, param.c_str(), -1, SQLITE_TRANSIENT);

        while (sqlite3_step(stmt.get()) == SQLITE_ROW)
        {
            SummaryRecord record;
            record.reference_key = columnText(stmt.get(), 0);
            record.upload_reference = columnText(stmt.get(), 1);
            record.is_ai_generated = sqlite3_column_int(stmt.get(), 2) != 0;
            record.confidence_score = sqlite3_column_double(stmt.get(), 3);
            record.algorithm_version = columnText(stmt.get(), 4);
            record.processing_time_ms = sqlite3_column_double(stmt.get(), 5);
            record.result_summary = columnText(stmt.get(), 6);
            record.created_at = columnText(stmt.get(), 7);
            records.push_back(std::move(record));
        }
    }

    for (auto &record : records)
    {
        record.methods = readMethodRows(record.reference_key);
    }
    return records;
}

std::vector<MethodResultRow> SqliteSummaryStore::readMethodRows(const std::string &reference_key)
{
    std::vector<MethodResultRow> rows;
    const std::string select_sql = R"(
        SELECT method_name, status, score, reason, processing_time_ms
        FROM method_results WHERE reference_key = ? ORDER BY id ASC
    )";

    StatementGuard stmt;
    if (sqlite3_prepare_v2(connection_.handle(), select_sql.c_str(), -1, stmt.out(), nullptr) != SQLITE_OK)
    {
        Logger::error("Failed to prepare method result query: " + connection_.lastError());
        return rows;
    }
    sqlite3_bind_text(stmt.get(), 1, reference_key.c_str(), -1, SQLITE_TRANSIENT);

    while (sqlite3_step(stmt.get()) == SQLITE_ROW)
    {
        MethodResultRow row;
        row.method_name = columnText(stmt.get(), 0);
        row.status = columnText(stmt.get(), 1);
        if (sqlite3_column_type(stmt.get(), 2) != SQLITE_NULL)
            row.score = sqlite3_column_double(stmt.get(), 2);
        row.reason = columnText(stmt.get(), 3);
        row.processing_time_ms = sqlite3_column_double(stmt.get(), 4);
        rows.push_back(std::move(row));
    }
    return rows;
}
