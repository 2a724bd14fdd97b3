#pragma once

/**
 * @file ride_repository.h
 * @brief Repository for the ride table
 *
 * Rides are returned with their non-deleted tag links.
 */

#include <vector>
#include <json/json.h>
#include "i_query_executor.h"
#include "../domain/models/ride.h"

namespace repositories {

class RideRepository {
public:
    explicit RideRepository(common::IQueryExecutor* executor);
    ~RideRepository();

    /**
     * @brief Non-deleted rides of a user ordered by id
     * @param limit -1 for all rows
     */
    std::vector<domain::models::Ride> findAll(uint32_t userId, int64_t limit = -1,
                                              int64_t offset = 0);

    int64_t countAll(uint32_t userId);

    /**
     * @throws common::NotFoundException when missing or deleted
     */
    domain::models::Ride findById(uint32_t id);

    /**
     * @brief Check that the ride exists, is not deleted and belongs to the user
     * @throws common::NotFoundException otherwise
     */
    void requireOwner(uint32_t rideId, uint32_t userId);

    /**
     * @brief Insert a ride; id and tags of the input are ignored
     * @return stored ride (without tags)
     */
    domain::models::Ride insert(uint32_t userId, const domain::models::Ride& ride);

    /**
     * @throws common::NotFoundException when nothing was updated
     */
    void update(uint32_t id, const domain::models::Ride& ride);

    /**
     * @brief Soft delete
     * @throws common::NotFoundException when missing or already deleted
     */
    void remove(uint32_t id);

private:
    common::IQueryExecutor* executor_;

    domain::models::Ride jsonToModel(const Json::Value& row);
    void loadTags(domain::models::Ride& ride);
};

} // namespace repositories
