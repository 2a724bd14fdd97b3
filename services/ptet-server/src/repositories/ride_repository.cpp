/** @file ride_repository.cpp
 *  @brief RideRepository implementation
 */

#include "ride_repository.h"
#include "ride_tag_link_repository.h"
#include "repository_utils.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace repositories {

using domain::models::Ride;

namespace {
const char* const kSelectColumns =
    "SELECT id, journey_departure, journey_arrival, location_from, location_to, "
    "       remarks, is_template FROM ride ";
}

RideRepository::RideRepository(common::IQueryExecutor* executor)
    : executor_(executor)
{
    if (!executor_) {
        throw std::invalid_argument("RideRepository: executor cannot be nullptr");
    }
    spdlog::debug("[RideRepository] Initialized (DB type: {})", executor_->getDatabaseType());
}

RideRepository::~RideRepository() {}

std::vector<Ride> RideRepository::findAll(uint32_t userId, int64_t limit, int64_t offset) {
    std::vector<Ride> items;
    try {
        Json::Value result = executor_->executeQuery(
            std::string(kSelectColumns) +
            "WHERE user_id = ? AND deleted_at IS NULL ORDER BY id LIMIT ? OFFSET ?",
            {static_cast<int64_t>(userId), limit, offset});

        for (const auto& row : result) {
            items.push_back(jsonToModel(row));
            loadTags(items.back());
        }
    } catch (const common::DatabaseException& e) {
        spdlog::error("[RideRepository] findAll failed: {}", e.what());
        throw;
    }
    return items;
}

int64_t RideRepository::countAll(uint32_t userId) {
    try {
        Json::Value result = executor_->executeScalar(
            "SELECT COUNT(*) FROM ride WHERE user_id = ? AND deleted_at IS NULL",
            {static_cast<int64_t>(userId)});
        return common::db::scalarToInt64(result);
    } catch (const common::DatabaseException& e) {
        spdlog::error("[RideRepository] countAll failed: {}", e.what());
        throw;
    }
}

Ride RideRepository::findById(uint32_t id) {
    Json::Value result;
    try {
        result = executor_->executeQuery(
            std::string(kSelectColumns) + "WHERE id = ? AND deleted_at IS NULL",
            {static_cast<int64_t>(id)});
    } catch (const common::DatabaseException& e) {
        spdlog::error("[RideRepository] findById failed: {}", e.what());
        throw;
    }

    if (result.empty()) {
        throw common::NotFoundException();
    }

    Ride ride = jsonToModel(result[0]);
    try {
        loadTags(ride);
    } catch (const common::DatabaseException& e) {
        spdlog::error("[RideRepository] Loading tags of ride {} failed: {}", id, e.what());
        throw;
    }
    return ride;
}

void RideRepository::requireOwner(uint32_t rideId, uint32_t userId) {
    Json::Value result;
    try {
        result = executor_->executeScalar(
            "SELECT COUNT(*) FROM ride WHERE id = ? AND user_id = ? AND deleted_at IS NULL",
            {static_cast<int64_t>(rideId), static_cast<int64_t>(userId)});
    } catch (const common::DatabaseException& e) {
        spdlog::error("[RideRepository] requireOwner failed: {}", e.what());
        throw;
    }

    if (common::db::scalarToInt64(result) == 0) {
        throw common::NotFoundException();
    }
}

Ride RideRepository::insert(uint32_t userId, const Ride& ride) {
    std::string now = nowText();

    Json::Value result;
    try {
        result = executor_->executeQuery(
            "INSERT INTO ride (created_at, updated_at, user_id, journey_departure, journey_arrival, "
            "                  location_from, location_to, remarks, is_template) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?) RETURNING id",
            {now, now, static_cast<int64_t>(userId), timestampParam(ride.journeyDeparture),
             optionalTimestamp(ride.journeyArrival), ride.locationFrom, ride.locationTo,
             optionalText(ride.remarks), static_cast<int64_t>(ride.isTemplate ? 1 : 0)});
    } catch (const common::DatabaseException& e) {
        spdlog::error("[RideRepository] Insert failed: {}", e.what());
        throw;
    }

    if (result.empty()) {
        throw common::InternalException("Insert into ride returned no id");
    }

    Ride stored = ride;
    stored.id = getId(result[0], "id");
    stored.tags.clear();
    spdlog::info("[RideRepository] Inserted ride {} for user {}", stored.id, userId);
    return stored;
}

void RideRepository::update(uint32_t id, const Ride& ride) {
    int rowsAffected = 0;
    try {
        rowsAffected = executor_->executeCommand(
            "UPDATE ride SET updated_at = ?, journey_departure = ?, journey_arrival = ?, "
            "  location_from = ?, location_to = ?, remarks = ?, is_template = ? "
            "WHERE id = ? AND deleted_at IS NULL",
            {nowText(), timestampParam(ride.journeyDeparture), optionalTimestamp(ride.journeyArrival),
             ride.locationFrom, ride.locationTo, optionalText(ride.remarks),
             static_cast<int64_t>(ride.isTemplate ? 1 : 0), static_cast<int64_t>(id)});
    } catch (const common::DatabaseException& e) {
        spdlog::error("[RideRepository] Update failed: {}", e.what());
        throw;
    }

    if (rowsAffected == 0) {
        throw common::NotFoundException();
    }
    spdlog::info("[RideRepository] Updated ride {}", id);
}

void RideRepository::remove(uint32_t id) {
    int rowsAffected = 0;
    try {
        rowsAffected = executor_->executeCommand(
            "UPDATE ride SET deleted_at = ? WHERE id = ? AND deleted_at IS NULL",
            {nowText(), static_cast<int64_t>(id)});
    } catch (const common::DatabaseException& e) {
        spdlog::error("[RideRepository] Remove failed: {}", e.what());
        throw;
    }

    if (rowsAffected == 0) {
        throw common::NotFoundException();
    }
    spdlog::info("[RideRepository] Deleted ride {}", id);
}

Ride RideRepository::jsonToModel(const Json::Value& row) {
    Ride ride;
    ride.id = getId(row, "id");
    ride.journeyDeparture = getTimestamp(row, "journey_departure");
    ride.journeyArrival = getOptionalTimestamp(row, "journey_arrival");
    ride.locationFrom = common::db::getString(row, "location_from");
    ride.locationTo = common::db::getString(row, "location_to");
    ride.remarks = common::db::getOptionalString(row, "remarks");
    ride.isTemplate = common::db::getBool(row, "is_template");
    return ride;
}

void RideRepository::loadTags(Ride& ride) {
    std::string query = std::string("SELECT ") + RideTagLinkRepository::selectColumns() +
        " FROM ride_tag WHERE ride_id = ? AND deleted_at IS NULL ORDER BY \"order\", id";
    Json::Value result = executor_->executeQuery(query, {static_cast<int64_t>(ride.id)});

    ride.tags.clear();
    for (const auto& row : result) {
        ride.tags.push_back(RideTagLinkRepository::jsonToModel(row));
    }
}

} // namespace repositories
