#include "database/sqlite_connection.hpp"
#include "logging/logger.hpp"

SqliteConnection::~SqliteConnection()
{
    if (db_)
    {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

DBOpResult SqliteConnection::open(const std::string &path)
{
    path_ = path;
    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK)
    {
        std::string msg = "Failed to open database " + path + ": " + std::string(sqlite3_errmsg(db_));
        Logger::error(msg);
        sqlite3_close(db_);
        db_ = nullptr;
        return DBOpResult(false, msg);
    }

    rc = sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK)
    {
        Logger::warn("Failed to enable WAL mode: " + lastError());
    }
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    sqlite3_busy_timeout(db_, 5000);

    rc = sqlite3_exec(db_, "PRAGMA foreign_keys=ON;", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK)
    {
        Logger::warn("Failed to enable foreign keys: " + lastError());
    }

    Logger::debug("Database opened: " + path);
    return DBOpResult(true);
}

DBOpResult SqliteConnection::exec(const std::string &sql)
{
    if (!db_)
    {
        return DBOpResult(false, "Database not initialized");
    }
    char *err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK)
    {
        std::string msg = err_msg ? err_msg : lastError();
        sqlite3_free(err_msg);
        return DBOpResult(false, msg);
    }
    return DBOpResult(true);
}

std::string SqliteConnection::lastError() const
{
    return db_ ? std::string(sqlite3_errmsg(db_)) : std::string("Database not initialized");
}
