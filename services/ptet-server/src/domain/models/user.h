#pragma once

/**
 * @file user.h
 * @brief User domain model, one row per (JWT issuer, JWT subject)
 */

#include <cstdint>
#include <optional>
#include <string>

namespace domain {
namespace models {

struct User {
    uint32_t id = 0;
    std::string jwtIssuer;
    std::string jwtSubject;
    std::optional<std::string> name;
};

} // namespace models
} // namespace domain
