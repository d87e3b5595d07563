#pragma once

#include <mutex>
#include <optional>
#include <string>
#include "database/result_store.hpp"
#include "database/sqlite_connection.hpp"

/**
 * @brief DetailStore keeping one JSON document per reference key in SQLite
 *
 * Rewriting a key replaces its document, so a failed detail write can be retried.
 */
class SqliteDocumentStore : public DetailStore
{
public:
    explicit SqliteDocumentStore(const std::string &db_path);

    DBOpResult writeDetail(const std::string &reference_key, const nlohmann::json &document) override;
    std::optional<nlohmann::json> readDetail(const std::string &reference_key) override;

    bool isReady() const { return ready_; }

private:
    std::mutex mutex_;
    SqliteConnection connection_;
    bool ready_ = false;
};
