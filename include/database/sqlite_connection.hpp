#pragma once

#include <string>
#include <sqlite3.h>
#include "database/result_store.hpp"

/**
 * @brief Owns one sqlite3 handle opened with the engine's pragmas
 */
class SqliteConnection
{
public:
    SqliteConnection() = default;
    ~SqliteConnection();

    SqliteConnection(const SqliteConnection &) = delete;
    SqliteConnection &operator=(const SqliteConnection &) = delete;

    /**
     * @brief Open (or create) the database file and enable WAL and foreign keys
     */
    DBOpResult open(const std::string &path);

    /**
     * @brief Run one or more statements that return no rows
     */
    DBOpResult exec(const std::string &sql);

    sqlite3 *handle() const { return db_; }
    bool isOpen() const { return db_ != nullptr; }
    const std::string &path() const { return path_; }
    std::string lastError() const;

private:
    sqlite3 *db_ = nullptr;
    std::string path_;
};

/**
 * @brief Finalizes a prepared statement when leaving scope
 */
class StatementGuard
{
public:
    explicit StatementGuard(sqlite3_stmt *stmt = nullptr) : stmt_(stmt) {}
    ~StatementGuard()
    {
        if (stmt_)
            sqlite3_finalize(stmt_);
    }
    StatementGuard(const StatementGuard &) = delete;
    StatementGuard &operator=(const StatementGuard &) = delete;

    sqlite3_stmt **out() { return &stmt_; }
    sqlite3_stmt *get() const { return stmt_; }

private:
    sqlite3_stmt *stmt_;
};
