/**
 * @file user_service.cpp
 * @brief UserService implementation
 */

#include "user_service.h"
#include "exceptions.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace services {

UserService::UserService(repositories::UserRepository* userRepo)
    : userRepo_(userRepo)
{
    if (!userRepo_) {
        throw std::invalid_argument("UserService: userRepo cannot be nullptr");
    }
    spdlog::debug("[UserService] Initialized");
}

domain::models::User UserService::current(uint32_t userId) {
    auto user = userRepo_->findById(userId);
    if (!user) {
        throw common::NotFoundException();
    }
    return *user;
}

void UserService::rename(uint32_t userId, const std::optional<std::string>& name) {
    userRepo_->updateName(userId, name);
}

} // namespace services
