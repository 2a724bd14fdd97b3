#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include "../common/pagination.h"
#include "../domain/models/ride.h"
#include "../repositories/ride_repository.h"

/**
 * @file ride_service.h
 * @brief Ride Service - rides of the authenticated user
 *
 * Every operation on a single ride checks its owner first; foreign,
 * deleted and missing rides all raise NotFoundException.
 *
 * @date 2026-03-25
 */

namespace services {

class RideService {
public:
    struct ListResult {
        std::vector<domain::models::Ride> items;
        int64_t totalItems = 0;
    };

    /**
     * @brief Constructor with Repository Dependency Injection (non-owning pointer)
     * @throws std::invalid_argument if rideRepo is nullptr
     */
    explicit RideService(repositories::RideRepository* rideRepo);

    ListResult list(uint32_t userId, const std::optional<common::PageRequest>& page = std::nullopt);

    domain::models::Ride create(uint32_t userId, const domain::models::Ride& ride);

    /// @throws common::NotFoundException when the ride is not the user's
    domain::models::Ride get(uint32_t userId, uint32_t rideId);

    void update(uint32_t userId, uint32_t rideId, const domain::models::Ride& ride);

    /// Soft delete
    void remove(uint32_t userId, uint32_t rideId);

private:
    repositories::RideRepository* rideRepo_;
};

} // namespace services
