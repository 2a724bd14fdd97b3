#pragma once

/**
 * @file ride_tag_link_repository.h
 * @brief Repository for the ride_tag table (tag values attached to rides)
 *
 * A link stores its value in exactly one of the value_* columns; the other
 * value columns are NULL.
 */

#include <optional>
#include <vector>
#include <json/json.h>
#include "i_query_executor.h"
#include "../domain/models/ride_tag_link.h"

namespace repositories {

class RideTagLinkRepository {
public:
    explicit RideTagLinkRepository(common::IQueryExecutor* executor);
    ~RideTagLinkRepository();

    /**
     * @brief Non-deleted links of a ride ordered by "order", then id
     * @param limit -1 for all rows
     */
    std::vector<domain::models::RideTagLink> findAll(uint32_t rideId, int64_t limit = -1,
                                                     int64_t offset = 0);

    int64_t countAll(uint32_t rideId);

    /**
     * @throws common::NotFoundException when missing or deleted
     */
    domain::models::RideTagLink findById(uint32_t id);

    /**
     * @brief Non-deleted link between a ride and a tag, if any
     */
    std::optional<domain::models::RideTagLink> findByTagId(uint32_t rideId, uint32_t tagId);

    /**
     * @brief Check that the link exists and its ride belongs to the user
     *
     * Deleted links and links of deleted rides do not count.
     *
     * @throws common::NotFoundException otherwise
     */
    void requireOwner(uint32_t linkId, uint32_t userId);

    /**
     * @brief Insert a link; id, rideId and tagId of the input are ignored
     * @return stored link
     */
    domain::models::RideTagLink insert(uint32_t rideId, uint32_t tagId,
                                       const domain::models::RideTagLink& link);

    /**
     * @brief Replace order, value and remarks of a non-deleted link
     * @throws common::NotFoundException when nothing was updated
     */
    void update(uint32_t id, const domain::models::RideTagLink& link);

    /**
     * @brief Soft delete
     * @throws common::NotFoundException when the link is missing or already deleted
     */
    void remove(uint32_t id);

    /// Column list matching jsonToModel()
    static const char* selectColumns();

    /**
     * @brief Build a link from a ride_tag row
     * @throws common::InternalException when no value column is set
     */
    static domain::models::RideTagLink jsonToModel(const Json::Value& row);

private:
    common::IQueryExecutor* executor_;
};

} // namespace repositories
