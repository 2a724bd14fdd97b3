#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "../domain/models/user.h"
#include "../repositories/user_repository.h"

/**
 * @file user_service.h
 * @brief User Service - profile of the authenticated user
 */

namespace services {

class UserService {
public:
    /// @throws std::invalid_argument if userRepo is nullptr
    explicit UserService(repositories::UserRepository* userRepo);

    /// @throws common::NotFoundException when the user row is gone
    domain::models::User current(uint32_t userId);

    /// A null name clears it
    void rename(uint32_t userId, const std::optional<std::string>& name);

private:
    repositories::UserRepository* userRepo_;
};

} // namespace services
