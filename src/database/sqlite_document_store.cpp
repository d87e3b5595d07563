#include "database/sqlite_document_store.hpp"
#include "database/sql_scripts.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace
{
    std::string utcNow()
    {
        const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm{};
        gmtime_r(&now, &tm);
        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }
}

SqliteDocumentStore::SqliteDocumentStore(const std::string &db_path)
{
    if (!connection_.open(db_path).success)
        return;

    auto result = connection_.exec(DatabaseScripts::CREATE_DETECTION_DOCUMENTS_TABLE);
    if (!result.success)
    {
        Logger::error("Failed to create document schema in " + db_path + ": " + result.error_message);
        return;
    }
    ready_ = true;
    Logger::info("Detail store ready: " + db_path);
}

DBOpResult SqliteDocumentStore::writeDetail(const std::string &reference_key, const nlohmann::json &document)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ready_)
    {
        return DBOpResult(false, "Detail store not initialized");
    }

    const std::string insert_sql = R"(
        INSERT OR REPLACE INTO detection_documents (reference_key, document, written_at)
        VALUES (?, ?, ?)
    )";

    StatementGuard stmt;
    if (sqlite3_prepare_v2(connection_.handle(), insert_sql.c_str(), -1, stmt.out(), nullptr) != SQLITE_OK)
    {
        std::string msg = "Failed to prepare statement: " + connection_.lastError();
        Logger::error(msg);
        return DBOpResult(false, msg);
    }

    const std::string serialized = document.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    const std::string written_at = utcNow();
    sqlite3_bind_text(stmt.get(), 1, reference_key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, serialized.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 3, written_at.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    {
        std::string msg = "Failed to write detail document " + reference_key + ": " + connection_.lastError();
        Logger::error(msg);
        return DBOpResult(false, msg);
    }
    return DBOpResult(true);
}

std::optional<nlohmann::json> SqliteDocumentStore::readDetail(const std::string &reference_key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ready_)
        return std::nullopt;

    StatementGuard stmt;
    if (sqlite3_prepare_v2(connection_.handle(), "SELECT document FROM detection_documents WHERE reference_key = ?",
                           -1, stmt.out(), nullptr) != SQLITE_OK)
    {
        Logger::error("Failed to prepare document query: " + connection_.lastError());
        return std::nullopt;
    }
    sqlite3_bind_text(stmt.get(), 1, reference_key.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW)
        return std::nullopt;

    const unsigned char *text = sqlite3_column_text(stmt.get(), 0);
    if (!text)
        return std::nullopt;
    try
    {
        return nlohmann::json::parse(reinterpret_cast<const char *>(text));
    }
    catch (const nlohmann::json::parse_error &e)
    {
        Logger::error("Corrupt detail document " + reference_key + ": " + e.what());
        return std::nullopt;
    }
}
