#pragma once

/**
 * @file user_repository.h
 * @brief Repository for the user table
 *
 * Users are never created explicitly; the first authenticated request of
 * a (JWT issuer, JWT subject) pair creates the row.
 */

#include <optional>
#include <string>
#include <json/json.h>
#include "i_query_executor.h"
#include "../domain/models/user.h"

namespace repositories {

class UserRepository {
public:
    explicit UserRepository(common::IQueryExecutor* executor);
    ~UserRepository();

    /**
     * @brief Return the user of an issuer/subject pair, creating it when new
     *
     * Safe against concurrent first requests of the same pair (the insert
     * is ON CONFLICT DO NOTHING, followed by a lookup).
     */
    domain::models::User findOrCreate(const std::string& jwtIssuer, const std::string& jwtSubject);

    std::optional<domain::models::User> findById(uint32_t id);

    /**
     * @brief Set or clear the display name
     * @throws common::NotFoundException when the user does not exist
     */
    void updateName(uint32_t id, const std::optional<std::string>& name);

private:
    common::IQueryExecutor* executor_;

    domain::models::User jsonToModel(const Json::Value& row);
};

} // namespace repositories
