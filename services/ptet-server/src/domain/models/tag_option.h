#pragma once

/**
 * @file tag_option.h
 * @brief TagOption domain model, one allowed value of an enum tag
 */

#include <cstdint>
#include <optional>
#include <string>

namespace domain {
namespace models {

struct TagOption {
    uint32_t id = 0;
    uint32_t tagId = 0;
    uint32_t order = 0;
    std::string value;
    std::string uuid;
    std::optional<std::string> name;

    /// name when set, value otherwise
    std::string displayName() const { return name ? *name : value; }
};

} // namespace models
} // namespace domain
