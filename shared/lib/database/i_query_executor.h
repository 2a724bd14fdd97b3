#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>
#include <json/json.h>

/**
 * @file i_query_executor.h
 * @brief Query Executor Interface - storage-agnostic query execution
 *
 * Repositories talk to the database only through this interface and get
 * rows back as JSON objects. The SQLite implementation lives in
 * sqlite_query_executor.h; tests can substitute their own executor.
 *
 * @date 2026-03-24
 */

namespace common {

/**
 * @brief Bound parameter value
 *
 * std::monostate binds SQL NULL. Booleans are bound as 0/1 integers.
 */
using QueryParam = std::variant<std::monostate, int64_t, double, std::string>;
using QueryParams = std::vector<QueryParam>;

/// NULL parameter
inline QueryParam nullParam() { return QueryParam{}; }

/**
 * @brief Query Executor Interface
 *
 * Placeholders are positional ("?" or "?NNN").
 */
class IQueryExecutor {
public:
    virtual ~IQueryExecutor() = default;

    /**
     * @brief Execute a statement returning rows (SELECT, or DML with RETURNING)
     *
     * @return Json::Value Array of result rows, each row is a JSON object with
     *         column name-value pairs. INTEGER columns map to Int64, REAL to
     *         double, TEXT to string and NULL to null.
     *
     * Example result:
     * [
     *   {"id": 1, "jwt_issuer": "issuer@example.tld", "name": null}
     * ]
     *
     * @throws DatabaseException on failure
     */
    virtual Json::Value executeQuery(
        const std::string& query,
        const QueryParams& params = {}
    ) = 0;

    /**
     * @brief Execute INSERT/UPDATE/DELETE command
     *
     * @return Number of affected rows
     * @throws DatabaseException on failure
     */
    virtual int executeCommand(
        const std::string& query,
        const QueryParams& params = {}
    ) = 0;

    /**
     * @brief Execute query and return single scalar value
     *
     * Example: executeScalar("SELECT COUNT(*) FROM ride") -> 42
     *
     * @throws DatabaseException if the query fails, returns no rows or
     *         more than one column
     */
    virtual Json::Value executeScalar(
        const std::string& query,
        const QueryParams& params = {}
    ) = 0;

    /**
     * @brief Get database type (for diagnostic purposes)
     * @return "sqlite"
     */
    virtual std::string getDatabaseType() const = 0;
};

/**
 * @brief Factory function to create the QueryExecutor for a database URI
 *
 * Supported URIs:
 *   - sqlite://<path>[?mode=rwc|rw|ro]
 *   - sqlite::memory:
 *
 * @throws ConfigException for unsupported or malformed URIs
 * @throws DatabaseException when the database cannot be opened
 */
std::unique_ptr<IQueryExecutor> createQueryExecutor(const std::string& databaseUri);

} // namespace common
