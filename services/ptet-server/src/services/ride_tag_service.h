#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include "../common/pagination.h"
#include "../domain/models/ride_tag_link.h"
#include "../repositories/ride_repository.h"
#include "../repositories/ride_tag_link_repository.h"
#include "../repositories/tag_repository.h"

/**
 * @file ride_tag_service.h
 * @brief Ride Tag Service - tag values attached to rides
 *
 * Responsibilities:
 * - Ownership checks across ride, tag and link
 * - One link per (ride, tag)
 * - Validation of link values against the tag type and its options
 *
 * Does NOT handle:
 * - HTTP request/response (Handler's job)
 * - Token verification (RequestAuthenticator's job)
 *
 * @date 2026-03-25
 */

namespace services {

class RideTagService {
public:
    struct ListResult {
        std::vector<domain::models::RideTagWithTag> items;
        int64_t totalItems = 0;
    };

    /**
     * @brief Constructor with Repository Dependency Injection (non-owning pointers)
     * @throws std::invalid_argument if a repository is nullptr
     */
    RideTagService(repositories::RideRepository* rideRepo,
                   repositories::TagRepository* tagRepo,
                   repositories::RideTagLinkRepository* linkRepo);

    /**
     * @brief Links of a ride, each with its tag
     * @throws common::NotFoundException when the ride is not the user's
     */
    ListResult list(uint32_t userId, uint32_t rideId,
                    const std::optional<common::PageRequest>& page = std::nullopt);

    /**
     * @brief Link between a ride and a tag
     * @throws common::NotFoundException when ride or tag is foreign, or no link exists
     */
    domain::models::RideTagWithTag getByTag(uint32_t userId, uint32_t rideId, uint32_t tagId);

    /**
     * @brief Attach a tag value to a ride
     *
     * @throws common::NotFoundException when ride or tag is foreign
     * @throws common::ApiError 400 when the tag is already linked to the ride
     * @throws common::DeserializationException when the value does not fit the tag
     */
    domain::models::RideTagLink create(uint32_t userId, uint32_t rideId, uint32_t tagId,
                                       const domain::models::RideTagLink& link);

    domain::models::RideTagWithTag getByLink(uint32_t userId, uint32_t linkId);

    /**
     * @brief Replace order, value and remarks; the value is validated against the linked tag
     */
    void update(uint32_t userId, uint32_t linkId, const domain::models::RideTagLink& link);

    void remove(uint32_t userId, uint32_t linkId);

private:
    repositories::RideRepository* rideRepo_;
    repositories::TagRepository* tagRepo_;
    repositories::RideTagLinkRepository* linkRepo_;
};

} // namespace services
