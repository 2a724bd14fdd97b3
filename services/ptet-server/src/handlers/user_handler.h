#pragma once

/**
 * @file user_handler.h
 * @brief HTTP handler for the current user (/api/v1/user)
 */

#include <drogon/drogon.h>
#include "../auth/request_authenticator.h"
#include "../services/user_service.h"

namespace handlers {

class UserHandler {
public:
    UserHandler(services::UserService* userService,
                auth::RequestAuthenticator* authenticator);
    ~UserHandler();

    void registerRoutes(drogon::HttpAppFramework& app);

private:
    services::UserService* userService_;
    auth::RequestAuthenticator* authenticator_;

    /** GET /api/v1/user - User record of the token's issuer/subject */
    void handleGet(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    /** PUT /api/v1/user - Set the display name (write token required) */
    void handleUpdate(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);
};

} // namespace handlers
