#include "i_query_executor.h"
#include "sqlite_query_executor.h"
#include <spdlog/spdlog.h>

/**
 * @file query_executor_factory.cpp
 * @brief Query Executor Factory Implementation
 *
 * Creates the QueryExecutor matching the scheme of a database URI.
 *
 * @date 2026-03-24
 */

namespace common {

std::unique_ptr<IQueryExecutor> createQueryExecutor(const std::string& databaseUri)
{
    SqliteUri uri = SqliteUri::parse(databaseUri);
    spdlog::debug("[QueryExecutorFactory] Creating sqlite executor for {}", uri.path);
    return std::make_unique<SqliteQueryExecutor>(uri);
}

} // namespace common
