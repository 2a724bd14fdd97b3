#pragma once

/**
 * @file ride_tag_link.h
 * @brief RideTagLink domain model, the value of one tag on one ride
 */

#include "tag.h"
#include "ptet/utils/time_utils.h"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace domain {
namespace models {

/**
 * @brief Typed tag value
 *
 * Exactly one alternative is held. On disk each alternative has its own
 * nullable column (value_integer, value_float, value_string,
 * value_date_time, value_enum_option_id).
 */
class RideTagValue {
public:
    enum class Type {
        Integer,
        Float,
        String,
        DateTime,
        EnumOption
    };

    RideTagValue() : type_(Type::Integer), data_(int64_t{0}) {}

    static RideTagValue integer(int64_t v) { return RideTagValue(Type::Integer, v); }
    static RideTagValue floating(double v) { return RideTagValue(Type::Float, v); }
    static RideTagValue string(std::string v) { return RideTagValue(Type::String, std::move(v)); }
    static RideTagValue dateTime(ptet::utils::TimePoint v) { return RideTagValue(Type::DateTime, v); }
    static RideTagValue enumOption(uint32_t optionId) { return RideTagValue(Type::EnumOption, optionId); }

    Type type() const { return type_; }

    int64_t asInteger() const { return std::get<int64_t>(data_); }
    double asFloat() const { return std::get<double>(data_); }
    const std::string& asString() const { return std::get<std::string>(data_); }
    ptet::utils::TimePoint asDateTime() const { return std::get<ptet::utils::TimePoint>(data_); }
    uint32_t asEnumOption() const { return std::get<uint32_t>(data_); }

    /// "Integer", "Float", "String", "DateTime" or "EnumOption" (JSON "type" field)
    static std::string typeName(Type type);
    static std::optional<Type> typeFromName(const std::string& name);

    /**
     * @brief Check that the value fits the tag it is attached to
     *
     * Enum values must reference one of tag.options.
     *
     * @throws common::DeserializationException naming the mismatch
     */
    void validate(const Tag& tag) const;

private:
    using Data = std::variant<int64_t, double, std::string, ptet::utils::TimePoint, uint32_t>;

    RideTagValue(Type type, Data data) : type_(type), data_(std::move(data)) {}

    Type type_;
    Data data_;
};

struct RideTagLink {
    uint32_t id = 0;
    uint32_t rideId = 0;
    uint32_t tagId = 0;
    uint32_t order = 0;
    RideTagValue value;
    std::optional<std::string> remarks;
};

/// A link together with the tag it refers to
struct RideTagWithTag {
    RideTagLink link;
    Tag tag;
};

} // namespace models
} // namespace domain
