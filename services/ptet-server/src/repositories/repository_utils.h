#pragma once

/**
 * @file repository_utils.h
 * @brief Parameter and timestamp conversions shared by the repositories
 */

#include "i_query_executor.h"
#include "exceptions.h"
#include "query_helpers.h"
#include "ptet/utils/time_utils.h"
#include <optional>
#include <string>

namespace repositories {

inline common::QueryParam optionalText(const std::optional<std::string>& value) {
    return value ? common::QueryParam(*value) : common::nullParam();
}

inline common::QueryParam timestampParam(const ptet::utils::TimePoint& tp) {
    return common::QueryParam(ptet::utils::formatRfc3339(tp));
}

inline common::QueryParam optionalTimestamp(const std::optional<ptet::utils::TimePoint>& tp) {
    return tp ? timestampParam(*tp) : common::nullParam();
}

/// Current time as stored in created_at/updated_at/deleted_at
inline std::string nowText() {
    return ptet::utils::formatRfc3339(ptet::utils::now());
}

inline ptet::utils::TimePoint getTimestamp(const Json::Value& row, const std::string& field) {
    std::string text = common::db::getString(row, field);
    auto tp = ptet::utils::parseRfc3339(text);
    if (!tp) {
        throw common::DatabaseException("Invalid timestamp '" + text + "' in column " + field);
    }
    return *tp;
}

inline std::optional<ptet::utils::TimePoint> getOptionalTimestamp(const Json::Value& row,
                                                                 const std::string& field) {
    auto text = common::db::getOptionalString(row, field);
    if (!text) {
        return std::nullopt;
    }
    auto tp = ptet::utils::parseRfc3339(*text);
    if (!tp) {
        throw common::DatabaseException("Invalid timestamp '" + *text + "' in column " + field);
    }
    return tp;
}

inline uint32_t getId(const Json::Value& row, const std::string& field) {
    return static_cast<uint32_t>(common::db::getInt64(row, field));
}

} // namespace repositories
