#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <json/json.h>

/**
 * @file query_helpers.h
 * @brief Typed access to result rows returned by IQueryExecutor
 *
 * Usage:
 *   #include "query_helpers.h"
 *   auto rows = queryExecutor_->executeQuery("SELECT id, name FROM user WHERE id = ?", {id});
 *   int64_t id = common::db::getInt64(rows[0], "id");
 *   auto name = common::db::getOptionalString(rows[0], "name");
 *
 * @date 2026-03-24
 */

namespace common::db {

// ============================================================================
// JSON Value Extraction
// ============================================================================

/**
 * @brief Extract a 64-bit integer column
 *
 * Accepts integer, double and numeric string values.
 *
 * @throws DatabaseException if the column is missing, NULL or not numeric
 */
int64_t getInt64(const Json::Value& row, const std::string& field);

/**
 * @brief Extract a nullable integer column
 */
std::optional<int64_t> getOptionalInt64(const Json::Value& row, const std::string& field);

/**
 * @brief Extract a nullable REAL column (integers are widened)
 */
std::optional<double> getOptionalDouble(const Json::Value& row, const std::string& field);

/**
 * @brief Extract a text column
 * @throws DatabaseException if the column is missing or NULL
 */
std::string getString(const Json::Value& row, const std::string& field);

/**
 * @brief Extract a nullable text column
 */
std::optional<std::string> getOptionalString(const Json::Value& row, const std::string& field);

/**
 * @brief Extract a boolean column (SQLite stores BOOLEAN as 0/1)
 */
bool getBool(const Json::Value& row, const std::string& field, bool defaultValue = false);

/**
 * @brief Convert a scalar JSON value (e.g. COUNT(*)) to integer
 *
 * @param value Scalar JSON value (not an object with fields)
 * @param defaultValue Default if null or unparseable
 */
int64_t scalarToInt64(const Json::Value& value, int64_t defaultValue = 0);

} // namespace common::db
