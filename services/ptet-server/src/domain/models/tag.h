#pragma once

/**
 * @file tag.h
 * @brief Tag descriptor domain model
 *
 * A tag is a user-defined typed attribute. Rides carry tag values through
 * RideTagLink; enum tags restrict their values to a list of TagOption.
 */

#include "tag_option.h"
#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace domain {
namespace models {

enum class TagType {
    Integer,
    Float,
    String,
    Enum,
    DateTime
};

/// "integer", "float", "string", "enum" or "date_time"
inline std::string tagTypeToString(TagType type) {
    switch (type) {
        case TagType::Integer:  return "integer";
        case TagType::Float:    return "float";
        case TagType::String:   return "string";
        case TagType::Enum:     return "enum";
        case TagType::DateTime: return "date_time";
    }
    return "string";
}

inline std::optional<TagType> tagTypeFromString(const std::string& text) {
    if (text == "integer") return TagType::Integer;
    if (text == "float") return TagType::Float;
    if (text == "string") return TagType::String;
    if (text == "enum") return TagType::Enum;
    if (text == "date_time") return TagType::DateTime;
    return std::nullopt;
}

struct Tag {
    uint32_t id = 0;
    TagType tagType = TagType::String;
    std::string tagKey;
    std::optional<std::string> tagName;
    std::string uuid;
    std::optional<std::string> unit;
    std::optional<std::string> remarks;
    std::optional<std::vector<TagOption>> options;  // set for enum tags only

    std::string displayName() const { return tagName ? *tagName : tagKey; }

    bool hasOption(uint32_t optionId) const {
        if (!options) {
            return false;
        }
        return std::any_of(options->begin(), options->end(),
                           [optionId](const TagOption& o) { return o.id == optionId; });
    }
};

} // namespace models
} // namespace domain
