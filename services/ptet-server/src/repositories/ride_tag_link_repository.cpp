/** @file ride_tag_link_repository.cpp
 *  @brief RideTagLinkRepository implementation
 */

#include "ride_tag_link_repository.h"
#include "repository_utils.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace repositories {

using domain::models::RideTagLink;
using domain::models::RideTagValue;

namespace {

/// value_integer, value_float, value_string, value_date_time, value_enum_option_id
common::QueryParams valueParams(const RideTagValue& value) {
    common::QueryParams params(5, common::nullParam());
    switch (value.type()) {
        case RideTagValue::Type::Integer:
            params[0] = value.asInteger();
            break;
        case RideTagValue::Type::Float:
            params[1] = value.asFloat();
            break;
        case RideTagValue::Type::String:
            params[2] = value.asString();
            break;
        case RideTagValue::Type::DateTime:
            params[3] = timestampParam(value.asDateTime());
            break;
        case RideTagValue::Type::EnumOption:
            params[4] = static_cast<int64_t>(value.asEnumOption());
            break;
    }
    return params;
}

} // namespace

RideTagLinkRepository::RideTagLinkRepository(common::IQueryExecutor* executor)
    : executor_(executor)
{
    if (!executor_) {
        throw std::invalid_argument("RideTagLinkRepository: executor cannot be nullptr");
    }
    spdlog::debug("[RideTagLinkRepository] Initialized (DB type: {})", executor_->getDatabaseType());
}

RideTagLinkRepository::~RideTagLinkRepository() {}

const char* RideTagLinkRepository::selectColumns() {
    return "id, ride_id, tag_descriptor_id, \"order\", value_integer, value_float, "
           "value_string, value_date_time, value_enum_option_id, remarks";
}

std::vector<RideTagLink> RideTagLinkRepository::findAll(uint32_t rideId, int64_t limit,
                                                        int64_t offset) {
    Json::Value result;
    try {
        std::string query = std::string("SELECT ") + selectColumns() +
            " FROM ride_tag WHERE ride_id = ? AND deleted_at IS NULL "
            "ORDER BY \"order\", id LIMIT ? OFFSET ?";
        result = executor_->executeQuery(query, {static_cast<int64_t>(rideId), limit, offset});
    } catch (const common::DatabaseException& e) {
        spdlog::error("[RideTagLinkRepository] findAll failed: {}", e.what());
        throw;
    }

    std::vector<RideTagLink> items;
    for (const auto& row : result) {
        items.push_back(jsonToModel(row));
    }
    return items;
}

int64_t RideTagLinkRepository::countAll(uint32_t rideId) {
    try {
        Json::Value result = executor_->executeScalar(
            "SELECT COUNT(*) FROM ride_tag WHERE ride_id = ? AND deleted_at IS NULL",
            {static_cast<int64_t>(rideId)});
        return common::db::scalarToInt64(result);
    } catch (const common::DatabaseException& e) {
        spdlog::error("[RideTagLinkRepository] countAll failed: {}", e.what());
        throw;
    }
}

RideTagLink RideTagLinkRepository::findById(uint32_t id) {
    Json::Value result;
    try {
        std::string query = std::string("SELECT ") + selectColumns() +
            " FROM ride_tag WHERE id = ? AND deleted_at IS NULL";
        result = executor_->executeQuery(query, {static_cast<int64_t>(id)});
    } catch (const common::DatabaseException& e) {
        spdlog::error("[RideTagLinkRepository] findById failed: {}", e.what());
        throw;
    }

    if (result.empty()) {
        throw common::NotFoundException();
    }
    return jsonToModel(result[0]);
}

std::optional<RideTagLink> RideTagLinkRepository::findByTagId(uint32_t rideId, uint32_t tagId) {
    Json::Value result;
    try {
        std::string query = std::string("SELECT ") + selectColumns() +
            " FROM ride_tag WHERE ride_id = ? AND tag_descriptor_id = ? AND deleted_at IS NULL "
            "ORDER BY id LIMIT 1";
        result = executor_->executeQuery(query,
            {static_cast<int64_t>(rideId), static_cast<int64_t>(tagId)});
    } catch (const common::DatabaseException& e) {
        spdlog::error("[RideTagLinkRepository] findByTagId failed: {}", e.what());
        throw;
    }

    if (result.empty()) {
        return std::nullopt;
    }
    return jsonToModel(result[0]);
}

void RideTagLinkRepository::requireOwner(uint32_t linkId, uint32_t userId) {
    Json::Value result;
    try {
        result = executor_->executeScalar(
            "SELECT COUNT(*) FROM ride_tag l JOIN ride r ON r.id = l.ride_id "
            "WHERE l.id = ? AND l.deleted_at IS NULL "
            "AND r.user_id = ? AND r.deleted_at IS NULL",
            {static_cast<int64_t>(linkId), static_cast<int64_t>(userId)});
    } catch (const common::DatabaseException& e) {
        spdlog::error("[RideTagLinkRepository] requireOwner failed: {}", e.what());
        throw;
    }

    if (common::db::scalarToInt64(result) == 0) {
        throw common::NotFoundException();
    }
}

RideTagLink RideTagLinkRepository::insert(uint32_t rideId, uint32_t tagId, const RideTagLink& link) {
    std::string now = nowText();
    common::QueryParams params = {
        now, now,
        static_cast<int64_t>(rideId),
        static_cast<int64_t>(tagId),
        static_cast<int64_t>(link.order),
    };
    for (auto& p : valueParams(link.value)) {
        params.push_back(std::move(p));
    }
    params.push_back(optionalText(link.remarks));

    Json::Value result;
    try {
        result = executor_->executeQuery(
            "INSERT INTO ride_tag (created_at, updated_at, ride_id, tag_descriptor_id, \"order\", "
            "                      value_integer, value_float, value_string, value_date_time, "
            "                      value_enum_option_id, remarks) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) RETURNING id",
            params);
    } catch (const common::DatabaseException& e) {
        spdlog::error("[RideTagLinkRepository] Insert failed: {}", e.what());
        throw;
    }

    if (result.empty()) {
        throw common::InternalException("Insert into ride_tag returned no id");
    }

    RideTagLink stored = link;
    stored.id = getId(result[0], "id");
    stored.rideId = rideId;
    stored.tagId = tagId;
    spdlog::info("[RideTagLinkRepository] Inserted link {} (ride {}, tag {})", stored.id, rideId, tagId);
    return stored;
}

void RideTagLinkRepository::update(uint32_t id, const RideTagLink& link) {
    common::QueryParams params = {nowText(), static_cast<int64_t>(link.order)};
    for (auto& p : valueParams(link.value)) {
        params.push_back(std::move(p));
    }
    params.push_back(optionalText(link.remarks));
    params.push_back(static_cast<int64_t>(id));

    int rowsAffected = 0;
    try {
        rowsAffected = executor_->executeCommand(
            "UPDATE ride_tag SET updated_at = ?, \"order\" = ?, "
            "  value_integer = ?, value_float = ?, value_string = ?, value_date_time = ?, "
            "  value_enum_option_id = ?, remarks = ? "
            "WHERE id = ? AND deleted_at IS NULL",
            params);
    } catch (const common::DatabaseException& e) {
        spdlog::error("[RideTagLinkRepository] Update failed: {}", e.what());
        throw;
    }

    if (rowsAffected == 0) {
        throw common::NotFoundException();
    }
    spdlog::info("[RideTagLinkRepository] Updated link {}", id);
}

void RideTagLinkRepository::remove(uint32_t id) {
    int rowsAffected = 0;
    try {
        rowsAffected = executor_->executeCommand(
            "UPDATE ride_tag SET deleted_at = ? WHERE id = ? AND deleted_at IS NULL",
            {nowText(), static_cast<int64_t>(id)});
    } catch (const common::DatabaseException& e) {
        spdlog::error("[RideTagLinkRepository] Remove failed: {}", e.what());
        throw;
    }

    if (rowsAffected == 0) {
        throw common::NotFoundException();
    }
    spdlog::info("[RideTagLinkRepository] Deleted link {}", id);
}

RideTagLink RideTagLinkRepository::jsonToModel(const Json::Value& row) {
    RideTagLink link;
    link.id = getId(row, "id");
    link.rideId = getId(row, "ride_id");
    link.tagId = getId(row, "tag_descriptor_id");
    link.order = static_cast<uint32_t>(common::db::getOptionalInt64(row, "order").value_or(0));
    link.remarks = common::db::getOptionalString(row, "remarks");

    // First non-NULL value column decides the type
    if (auto v = common::db::getOptionalInt64(row, "value_integer")) {
        link.value = RideTagValue::integer(*v);
    } else if (auto v = common::db::getOptionalDouble(row, "value_float")) {
        link.value = RideTagValue::floating(*v);
    } else if (auto v = common::db::getOptionalString(row, "value_string")) {
        link.value = RideTagValue::string(*v);
    } else if (auto v = getOptionalTimestamp(row, "value_date_time")) {
        link.value = RideTagValue::dateTime(*v);
    } else if (auto v = common::db::getOptionalInt64(row, "value_enum_option_id")) {
        link.value = RideTagValue::enumOption(static_cast<uint32_t>(*v));
    } else {
        throw common::InternalException("Cannot infer value type from " + std::to_string(link.id));
    }
    return link;
}

} // namespace repositories
