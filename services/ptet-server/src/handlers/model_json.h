#pragma once

/**
 * @file model_json.h
 * @brief JSON mapping of the API models
 *
 * Output functions render the complete model. Input functions read the
 * client-writable fields only; server-assigned fields (ids, uuid, display
 * names, tags/options) are ignored when present. Invalid input throws
 * common::DeserializationException naming the offending field.
 */

#include "../domain/models/ride.h"
#include "../domain/models/ride_tag_link.h"
#include "../domain/models/tag.h"
#include "../domain/models/tag_option.h"
#include "../domain/models/user.h"
#include <optional>
#include <string>
#include <json/json.h>

namespace handlers {

// --- Output ---

Json::Value toJson(const domain::models::User& user);
Json::Value toJson(const domain::models::Ride& ride);
Json::Value toJson(const domain::models::Tag& tag);
Json::Value toJson(const domain::models::TagOption& option);
Json::Value toJson(const domain::models::RideTagValue& value);
Json::Value toJson(const domain::models::RideTagLink& link);
Json::Value toJson(const domain::models::RideTagWithTag& linkWithTag);

// --- Input ---

/**
 * @brief Parse a request body
 * @throws common::DeserializationException when the body is empty or not JSON
 */
Json::Value parseJsonBody(const std::string& body);

/// New display name of the current user ({"name": string|null})
std::optional<std::string> userNameFromJson(const Json::Value& json);

domain::models::Ride rideFromJson(const Json::Value& json);
domain::models::Tag tagFromJson(const Json::Value& json);
domain::models::TagOption tagOptionFromJson(const Json::Value& json);
domain::models::RideTagValue rideTagValueFromJson(const Json::Value& json);
domain::models::RideTagLink rideTagLinkFromJson(const Json::Value& json);

} // namespace handlers
