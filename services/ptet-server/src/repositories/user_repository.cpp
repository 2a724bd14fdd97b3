/** @file user_repository.cpp
 *  @brief UserRepository implementation
 */

#include "user_repository.h"
#include "repository_utils.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace repositories {

UserRepository::UserRepository(common::IQueryExecutor* executor)
    : executor_(executor)
{
    if (!executor_) {
        throw std::invalid_argument("UserRepository: executor cannot be nullptr");
    }
    spdlog::debug("[UserRepository] Initialized (DB type: {})", executor_->getDatabaseType());
}

UserRepository::~UserRepository() {}

domain::models::User UserRepository::findOrCreate(const std::string& jwtIssuer,
                                                  const std::string& jwtSubject) {
    Json::Value result;
    try {
        int inserted = executor_->executeCommand(
            "INSERT INTO \"user\" (jwt_issuer, jwt_subject) VALUES (?, ?) "
            "ON CONFLICT (jwt_issuer, jwt_subject) DO NOTHING",
            {jwtIssuer, jwtSubject});
        if (inserted > 0) {
            spdlog::info("[UserRepository] Created user for {} / {}", jwtIssuer, jwtSubject);
        }

        result = executor_->executeQuery(
            "SELECT id, jwt_issuer, jwt_subject, name FROM \"user\" "
            "WHERE jwt_issuer = ? AND jwt_subject = ?",
            {jwtIssuer, jwtSubject});

    } catch (const common::DatabaseException& e) {
        spdlog::error("[UserRepository] findOrCreate failed: {}", e.what());
        throw;
    }

    if (result.empty()) {
        throw common::InternalException("User for " + jwtIssuer + " / " + jwtSubject +
                                        " vanished after insert");
    }
    return jsonToModel(result[0]);
}

std::optional<domain::models::User> UserRepository::findById(uint32_t id) {
    try {
        Json::Value result = executor_->executeQuery(
            "SELECT id, jwt_issuer, jwt_subject, name FROM \"user\" WHERE id = ?",
            {static_cast<int64_t>(id)});

        if (result.empty()) {
            return std::nullopt;
        }
        return jsonToModel(result[0]);

    } catch (const common::DatabaseException& e) {
        spdlog::error("[UserRepository] findById failed: {}", e.what());
        throw;
    }
}

void UserRepository::updateName(uint32_t id, const std::optional<std::string>& name) {
    int rowsAffected = 0;
    try {
        rowsAffected = executor_->executeCommand(
            "UPDATE \"user\" SET name = ? WHERE id = ?",
            {optionalText(name), static_cast<int64_t>(id)});
    } catch (const common::DatabaseException& e) {
        spdlog::error("[UserRepository] updateName failed: {}", e.what());
        throw;
    }

    if (rowsAffected == 0) {
        throw common::NotFoundException();
    }
    spdlog::debug("[UserRepository] Updated name of user {}", id);
}

domain::models::User UserRepository::jsonToModel(const Json::Value& row) {
    domain::models::User user;
    user.id = getId(row, "id");
    user.jwtIssuer = common::db::getString(row, "jwt_issuer");
    user.jwtSubject = common::db::getString(row, "jwt_subject");
    user.name = common::db::getOptionalString(row, "name");
    return user;
}

} // namespace repositories
