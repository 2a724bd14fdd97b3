#pragma once

/**
 * @file ride.h
 * @brief Ride domain model
 */

#include "ride_tag_link.h"
#include "ptet/utils/time_utils.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace domain {
namespace models {

struct Ride {
    uint32_t id = 0;
    ptet::utils::TimePoint journeyDeparture;
    std::optional<ptet::utils::TimePoint> journeyArrival;
    std::string locationFrom;
    std::string locationTo;
    std::optional<std::string> remarks;
    bool isTemplate = false;
    std::vector<RideTagLink> tags;  // non-deleted links, read-only
};

} // namespace models
} // namespace domain
