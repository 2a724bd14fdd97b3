#pragma once

#include "i_query_executor.h"
#include <functional>
#include <mutex>
#include <string>
#include <sqlite3.h>

/**
 * @file sqlite_query_executor.h
 * @brief SQLite-specific Query Executor implementation
 *
 * Owns one sqlite3 connection opened in serialized mode. Statements from
 * different threads are serialised by a mutex so a statement and its
 * changes()/error message always belong together.
 *
 * @date 2026-03-24
 */

namespace common {

/**
 * @brief Parsed sqlite:// URI
 */
struct SqliteUri {
    enum class Mode { ReadWriteCreate, ReadWrite, ReadOnly };

    std::string path;                      ///< file path or ":memory:"
    Mode mode = Mode::ReadWriteCreate;

    /**
     * @brief Parse "sqlite://<path>[?mode=rwc|rw|ro]" or "sqlite::memory:"
     * @throws ConfigException on any other input
     */
    static SqliteUri parse(const std::string& uri);
};

class SqliteQueryExecutor : public IQueryExecutor {
public:
    /**
     * @brief Open the database and apply connection pragmas
     *
     * journal_mode=WAL, synchronous=NORMAL, foreign_keys=ON, busy timeout 5 s.
     *
     * @throws DatabaseException when the database cannot be opened
     */
    explicit SqliteQueryExecutor(const SqliteUri& uri);
    ~SqliteQueryExecutor() override;

    SqliteQueryExecutor(const SqliteQueryExecutor&) = delete;
    SqliteQueryExecutor& operator=(const SqliteQueryExecutor&) = delete;

    Json::Value executeQuery(const std::string& query, const QueryParams& params = {}) override;
    int executeCommand(const std::string& query, const QueryParams& params = {}) override;
    Json::Value executeScalar(const std::string& query, const QueryParams& params = {}) override;
    std::string getDatabaseType() const override { return "sqlite"; }

    /**
     * @brief Run one or more statements without parameters (DDL scripts)
     */
    void executeScript(const std::string& sql);

    /**
     * @brief Run work inside BEGIN IMMEDIATE / COMMIT
     *
     * Rolls back and rethrows when work throws. Other threads' statements
     * wait until the transaction has finished.
     */
    void transaction(const std::function<void()>& work);

    const std::string& path() const { return path_; }

private:
    sqlite3_stmt* prepare(const std::string& query, const QueryParams& params);
    void execLocked(const std::string& sql);

    sqlite3* db_ = nullptr;
    std::string path_;
    std::recursive_mutex mutex_;
};

} // namespace common
