/**
 * @file query_helpers.cpp
 * @brief Result row accessors implementation
 * @date 2026-03-24
 */

#include "query_helpers.h"
#include "exceptions.h"
#include <stdexcept>

namespace common::db {

namespace {

std::optional<int64_t> toInt64(const Json::Value& v) {
    if (v.isInt64()) return v.asInt64();
    if (v.isUInt64()) return static_cast<int64_t>(v.asUInt64());
    if (v.isDouble()) return static_cast<int64_t>(v.asDouble());
    if (v.isString()) {
        try {
            size_t consumed = 0;
            long long parsed = std::stoll(v.asString(), &consumed);
            if (consumed == v.asString().size()) return static_cast<int64_t>(parsed);
        } catch (const std::logic_error&) {
            // invalid_argument / out_of_range: not numeric
        }
    }
    return std::nullopt;
}

} // anonymous namespace

// ============================================================================
// JSON Value Extraction
// ============================================================================

int64_t getInt64(const Json::Value& row, const std::string& field) {
    auto value = getOptionalInt64(row, field);
    if (!value) {
        throw DatabaseException("Column '" + field + "' is not an integer");
    }
    return *value;
}

std::optional<int64_t> getOptionalInt64(const Json::Value& row, const std::string& field) {
    if (!row.isMember(field) || row[field].isNull()) return std::nullopt;
    return toInt64(row[field]);
}

std::optional<double> getOptionalDouble(const Json::Value& row, const std::string& field) {
    if (!row.isMember(field) || row[field].isNull()) return std::nullopt;
    const auto& v = row[field];
    if (v.isNumeric()) return v.asDouble();
    return std::nullopt;
}

std::string getString(const Json::Value& row, const std::string& field) {
    auto value = getOptionalString(row, field);
    if (!value) {
        throw DatabaseException("Column '" + field + "' is NULL");
    }
    return *value;
}

std::optional<std::string> getOptionalString(const Json::Value& row, const std::string& field) {
    if (!row.isMember(field) || row[field].isNull()) return std::nullopt;
    // Numbers are rendered as text
    return row[field].asString();
}

bool getBool(const Json::Value& row, const std::string& field, bool defaultValue) {
    if (!row.isMember(field) || row[field].isNull()) return defaultValue;
    const auto& v = row[field];
    if (v.isBool()) return v.asBool();
    if (v.isString()) {
        const auto& s = v.asString();
        return s == "1" || s == "true" || s == "TRUE";
    }
    auto number = toInt64(v);
    return number ? *number != 0 : defaultValue;
}

int64_t scalarToInt64(const Json::Value& value, int64_t defaultValue) {
    if (value.isNull()) return defaultValue;
    auto number = toInt64(value);
    return number ? *number : defaultValue;
}

} // namespace common::db
