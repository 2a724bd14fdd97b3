#pragma once

#include "sqlite_query_executor.h"
#include <string>
#include <vector>

/**
 * @file schema_migrator.h
 * @brief Forward-only schema migrations tracked in schema_migrations
 *
 * Each migration has a unique, sortable version string and a DDL script.
 * Pending migrations run in version order, each in its own transaction,
 * and are recorded with their application time.
 *
 * @date 2026-03-24
 */

namespace common {

struct Migration {
    std::string version;   ///< e.g. "m20250323_195423_ride"
    std::string sql;
};

class SchemaMigrator {
public:
    /**
     * @throws std::invalid_argument if executor is nullptr
     */
    SchemaMigrator(SqliteQueryExecutor* executor, std::vector<Migration> migrations);

    /** Versions already recorded in schema_migrations, sorted */
    std::vector<std::string> appliedVersions();

    /** Versions not yet applied, in the order they would run */
    std::vector<std::string> pendingVersions();

    /**
     * @brief Apply all pending migrations
     * @return number of migrations applied
     * @throws DatabaseException when a migration fails (that migration is rolled back)
     */
    int migrate();

private:
    void ensureMigrationTable();

    SqliteQueryExecutor* executor_;
    std::vector<Migration> migrations_;
};

} // namespace common
