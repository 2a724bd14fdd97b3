/**
 * @file ride_service.cpp
 * @brief RideService implementation
 */

#include "ride_service.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace services {

using domain::models::Ride;

RideService::RideService(repositories::RideRepository* rideRepo)
    : rideRepo_(rideRepo)
{
    if (!rideRepo_) {
        throw std::invalid_argument("RideService: rideRepo cannot be nullptr");
    }
    spdlog::debug("[RideService] Initialized");
}

RideService::ListResult RideService::list(uint32_t userId,
                                          const std::optional<common::PageRequest>& page) {
    ListResult result;
    result.totalItems = rideRepo_->countAll(userId);
    result.items = page
        ? rideRepo_->findAll(userId, page->limit(), page->offset())
        : rideRepo_->findAll(userId);
    return result;
}

Ride RideService::create(uint32_t userId, const Ride& ride) {
    return rideRepo_->insert(userId, ride);
}

Ride RideService::get(uint32_t userId, uint32_t rideId) {
    rideRepo_->requireOwner(rideId, userId);
    return rideRepo_->findById(rideId);
}

void RideService::update(uint32_t userId, uint32_t rideId, const Ride& ride) {
    rideRepo_->requireOwner(rideId, userId);
    rideRepo_->update(rideId, ride);
}

void RideService::remove(uint32_t userId, uint32_t rideId) {
    rideRepo_->requireOwner(rideId, userId);
    rideRepo_->remove(rideId);
}

} // namespace services
