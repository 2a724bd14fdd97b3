/** @file user_handler.cpp
 *  @brief UserHandler implementation
 */

#include "user_handler.h"
#include "handler_utils.h"
#include "model_json.h"
#include <spdlog/spdlog.h>

using namespace drogon;
using common::handler::authenticate;
using common::handler::errorResponse;

namespace handlers {

UserHandler::UserHandler(services::UserService* userService,
                         auth::RequestAuthenticator* authenticator)
    : userService_(userService), authenticator_(authenticator) {
    spdlog::info("[UserHandler] Initialized");
}

UserHandler::~UserHandler() {}

void UserHandler::registerRoutes(HttpAppFramework& app) {
    // GET /api/v1/user
    app.registerHandler(
        "/api/v1/user",
        [this](const HttpRequestPtr& req,
               std::function<void(const HttpResponsePtr&)>&& callback) {
            this->handleGet(req, std::move(callback));
        },
        {Get});

    // PUT /api/v1/user
    app.registerHandler(
        "/api/v1/user",
        [this](const HttpRequestPtr& req,
               std::function<void(const HttpResponsePtr&)>&& callback) {
            this->handleUpdate(req, std::move(callback));
        },
        {Put});

    spdlog::info("[UserHandler] Routes registered: GET/PUT /api/v1/user");
}

void UserHandler::handleGet(
    const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback) {

    try {
        auto ctx = authenticate(*authenticator_, req, auth::AccessMode::ReadOnly);

        callback(common::handler::jsonResponse(toJson(userService_->current(ctx.userId))));

    } catch (const std::exception& e) {
        callback(errorResponse("UserHandler", e));
    }
}

void UserHandler::handleUpdate(
    const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback) {

    try {
        auto ctx = authenticate(*authenticator_, req, auth::AccessMode::ReadWrite);
        auto name = userNameFromJson(common::handler::jsonBody(req));

        userService_->rename(ctx.userId, name);
        callback(common::handler::noContent());

    } catch (const std::exception& e) {
        callback(errorResponse("UserHandler", e));
    }
}

} // namespace handlers
