/**
 * @file model_json.cpp
 * @brief Model <-> JSON conversion
 */

#include "model_json.h"
#include "exceptions.h"
#include "ptet/utils/time_utils.h"
#include <memory>

namespace handlers {

using namespace domain::models;

namespace {

Json::Value optionalToJson(const std::optional<std::string>& value) {
    return value ? Json::Value(*value) : Json::Value(Json::nullValue);
}

Json::Value idToJson(uint32_t id) {
    return Json::Value(static_cast<Json::UInt>(id));
}

void requireObject(const Json::Value& json, const std::string& what) {
    if (!json.isObject()) {
        throw common::DeserializationException("Expected a JSON object for " + what);
    }
}

const Json::Value& requireField(const Json::Value& json, const std::string& field) {
    if (!json.isMember(field) || json[field].isNull()) {
        throw common::DeserializationException("Missing field '" + field + "'");
    }
    return json[field];
}

std::string requireString(const Json::Value& json, const std::string& field) {
    const Json::Value& value = requireField(json, field);
    if (!value.isString()) {
        throw common::DeserializationException("Field '" + field + "' must be a string");
    }
    return value.asString();
}

std::optional<std::string> optionalString(const Json::Value& json, const std::string& field) {
    if (!json.isMember(field) || json[field].isNull()) {
        return std::nullopt;
    }
    if (!json[field].isString()) {
        throw common::DeserializationException("Field '" + field + "' must be a string or null");
    }
    return json[field].asString();
}

bool requireBool(const Json::Value& json, const std::string& field) {
    const Json::Value& value = requireField(json, field);
    if (!value.isBool()) {
        throw common::DeserializationException("Field '" + field + "' must be a boolean");
    }
    return value.asBool();
}

uint32_t toUnsigned(const Json::Value& value, const std::string& field) {
    if (!value.isUInt()) {
        throw common::DeserializationException("Field '" + field + "' must be an unsigned integer");
    }
    return static_cast<uint32_t>(value.asUInt());
}

ptet::utils::TimePoint toDateTime(const Json::Value& value, const std::string& field) {
    if (value.isString()) {
        if (auto tp = ptet::utils::parseRfc3339(value.asString())) {
            return *tp;
        }
    }
    throw common::DeserializationException("Field '" + field + "' must be an RFC 3339 date-time");
}

std::optional<ptet::utils::TimePoint> optionalDateTime(const Json::Value& json, const std::string& field) {
    if (!json.isMember(field) || json[field].isNull()) {
        return std::nullopt;
    }
    return toDateTime(json[field], field);
}

} // namespace

// --- Output ---

Json::Value toJson(const User& user) {
    Json::Value json;
    json["id"] = idToJson(user.id);
    json["jwt_issuer"] = user.jwtIssuer;
    json["jwt_subject"] = user.jwtSubject;
    json["name"] = optionalToJson(user.name);
    return json;
}

Json::Value toJson(const Ride& ride) {
    Json::Value json;
    json["id"] = idToJson(ride.id);
    json["journey_departure"] = ptet::utils::formatRfc3339(ride.journeyDeparture);
    json["journey_arrival"] = ride.journeyArrival
        ? Json::Value(ptet::utils::formatRfc3339(*ride.journeyArrival))
        : Json::Value(Json::nullValue);
    json["location_from"] = ride.locationFrom;
    json["location_to"] = ride.locationTo;
    json["remarks"] = optionalToJson(ride.remarks);
    json["is_template"] = ride.isTemplate;

    Json::Value tags(Json::arrayValue);
    for (const auto& link : ride.tags) {
        tags.append(toJson(link));
    }
    json["tags"] = tags;
    return json;
}

Json::Value toJson(const Tag& tag) {
    Json::Value json;
    json["id"] = idToJson(tag.id);
    json["tag_type"] = tagTypeToString(tag.tagType);
    json["tag_key"] = tag.tagKey;
    json["tag_name"] = optionalToJson(tag.tagName);
    json["tag_display_name"] = tag.displayName();
    json["uuid"] = tag.uuid;
    json["unit"] = optionalToJson(tag.unit);
    json["remarks"] = optionalToJson(tag.remarks);

    if (tag.tagType == TagType::Enum) {
        Json::Value options(Json::arrayValue);
        if (tag.options) {
            for (const auto& option : *tag.options) {
                options.append(toJson(option));
            }
        }
        json["options"] = options;
    } else {
        json["options"] = Json::Value(Json::nullValue);
    }
    return json;
}

Json::Value toJson(const TagOption& option) {
    Json::Value json;
    json["id"] = idToJson(option.id);
    json["tag_id"] = idToJson(option.tagId);
    json["order"] = idToJson(option.order);
    json["value"] = option.value;
    json["uuid"] = option.uuid;
    json["name"] = optionalToJson(option.name);
    json["display_name"] = option.displayName();
    return json;
}

Json::Value toJson(const RideTagValue& value) {
    Json::Value json;
    json["type"] = RideTagValue::typeName(value.type());
    switch (value.type()) {
        case RideTagValue::Type::Integer:
            json["value"] = Json::Value(static_cast<Json::Int64>(value.asInteger()));
            break;
        case RideTagValue::Type::Float:
            json["value"] = value.asFloat();
            break;
        case RideTagValue::Type::String:
            json["value"] = value.asString();
            break;
        case RideTagValue::Type::DateTime:
            json["value"] = ptet::utils::formatRfc3339(value.asDateTime());
            break;
        case RideTagValue::Type::EnumOption:
            json["value"] = idToJson(value.asEnumOption());
            break;
    }
    return json;
}

Json::Value toJson(const RideTagLink& link) {
    Json::Value json;
    json["id"] = idToJson(link.id);
    json["ride_id"] = idToJson(link.rideId);
    json["tag_id"] = idToJson(link.tagId);
    json["order"] = idToJson(link.order);
    json["value"] = toJson(link.value);
    json["remarks"] = optionalToJson(link.remarks);
    return json;
}

Json::Value toJson(const RideTagWithTag& linkWithTag) {
    Json::Value json;
    json["link"] = toJson(linkWithTag.link);
    json["tag"] = toJson(linkWithTag.tag);
    return json;
}

// --- Input ---

Json::Value parseJsonBody(const std::string& body) {
    if (body.empty()) {
        throw common::DeserializationException("Request body is empty");
    }

    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value value;
    std::string errors;
    if (!reader->parse(body.data(), body.data() + body.size(), &value, &errors)) {
        throw common::DeserializationException("Request body is not valid JSON: " + errors);
    }
    return value;
}

std::optional<std::string> userNameFromJson(const Json::Value& json) {
    requireObject(json, "user");
    return optionalString(json, "name");
}

Ride rideFromJson(const Json::Value& json) {
    requireObject(json, "ride");

    Ride ride;
    ride.journeyDeparture = toDateTime(requireField(json, "journey_departure"), "journey_departure");
    ride.journeyArrival = optionalDateTime(json, "journey_arrival");
    ride.locationFrom = requireString(json, "location_from");
    ride.locationTo = requireString(json, "location_to");
    ride.remarks = optionalString(json, "remarks");
    ride.isTemplate = requireBool(json, "is_template");
    return ride;
}

Tag tagFromJson(const Json::Value& json) {
    requireObject(json, "tag");

    Tag tag;
    auto tagType = tagTypeFromString(requireString(json, "tag_type"));
    if (!tagType) {
        throw common::DeserializationException("Invalid tag type");
    }
    tag.tagType = *tagType;
    tag.tagKey = requireString(json, "tag_key");
    tag.tagName = optionalString(json, "tag_name");
    tag.unit = optionalString(json, "unit");
    tag.remarks = optionalString(json, "remarks");
    return tag;
}

TagOption tagOptionFromJson(const Json::Value& json) {
    requireObject(json, "tag option");

    TagOption option;
    option.order = toUnsigned(requireField(json, "order"), "order");
    option.value = requireString(json, "value");
    option.name = optionalString(json, "name");
    return option;
}

RideTagValue rideTagValueFromJson(const Json::Value& json) {
    requireObject(json, "value");

    std::string typeName = requireString(json, "type");
    auto type = RideTagValue::typeFromName(typeName);
    if (!type) {
        throw common::DeserializationException("Unknown value type '" + typeName + "'");
    }

    const Json::Value& value = requireField(json, "value");
    switch (*type) {
        case RideTagValue::Type::Integer:
            if (!value.isInt64()) {
                throw common::DeserializationException("Field 'value' must be an integer");
            }
            return RideTagValue::integer(value.asInt64());
        case RideTagValue::Type::Float:
            if (!value.isDouble()) {
                throw common::DeserializationException("Field 'value' must be a number");
            }
            return RideTagValue::floating(value.asDouble());
        case RideTagValue::Type::String:
            if (!value.isString()) {
                throw common::DeserializationException("Field 'value' must be a string");
            }
            return RideTagValue::string(value.asString());
        case RideTagValue::Type::DateTime:
            return RideTagValue::dateTime(toDateTime(value, "value"));
        case RideTagValue::Type::EnumOption:
            return RideTagValue::enumOption(toUnsigned(value, "value"));
    }
    throw common::DeserializationException("Unknown value type '" + typeName + "'");
}

RideTagLink rideTagLinkFromJson(const Json::Value& json) {
    requireObject(json, "ride tag link");

    RideTagLink link;
    link.order = toUnsigned(requireField(json, "order"), "order");
    link.value = rideTagValueFromJson(requireField(json, "value"));
    link.remarks = optionalString(json, "remarks");
    return link;
}

} // namespace handlers
