/**
 * @file ride_tag_link.cpp
 * @brief RideTagValue type names and validation against a tag
 */

#include "ride_tag_link.h"
#include "exceptions.h"

namespace domain {
namespace models {

std::string RideTagValue::typeName(Type type) {
    switch (type) {
        case Type::Integer:    return "Integer";
        case Type::Float:      return "Float";
        case Type::String:     return "String";
        case Type::DateTime:   return "DateTime";
        case Type::EnumOption: return "EnumOption";
    }
    return "Integer";
}

std::optional<RideTagValue::Type> RideTagValue::typeFromName(const std::string& name) {
    if (name == "Integer") return Type::Integer;
    if (name == "Float") return Type::Float;
    if (name == "String") return Type::String;
    if (name == "DateTime") return Type::DateTime;
    if (name == "EnumOption") return Type::EnumOption;
    return std::nullopt;
}

void RideTagValue::validate(const Tag& tag) const {
    switch (tag.tagType) {
        case TagType::Integer:
            if (type_ != Type::Integer) {
                throw common::DeserializationException("Expected integer value in link");
            }
            break;
        case TagType::Float:
            if (type_ != Type::Float) {
                throw common::DeserializationException("Expected float value in link");
            }
            break;
        case TagType::String:
            if (type_ != Type::String) {
                throw common::DeserializationException("Expected string value in link");
            }
            break;
        case TagType::DateTime:
            if (type_ != Type::DateTime) {
                throw common::DeserializationException("Expected date/time value in link");
            }
            break;
        case TagType::Enum:
            if (type_ != Type::EnumOption) {
                throw common::DeserializationException("Expected Option ID in link");
            }
            if (!tag.hasOption(asEnumOption())) {
                throw common::DeserializationException("Option ID does not belong to the tag");
            }
            break;
    }
}

} // namespace models
} // namespace domain
