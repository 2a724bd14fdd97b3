/** @file ride_handler.cpp
 *  @brief RideHandler implementation
 */

#include "ride_handler.h"
#include "handler_utils.h"
#include "model_json.h"
#include <spdlog/spdlog.h>

using namespace drogon;
using namespace common::handler;

namespace handlers {

RideHandler::RideHandler(services::RideService* rideService,
                         auth::RequestAuthenticator* authenticator)
    : rideService_(rideService), authenticator_(authenticator) {
    spdlog::info("[RideHandler] Initialized");
}

RideHandler::~RideHandler() {}

void RideHandler::registerRoutes(HttpAppFramework& app) {
    // GET /api/v1/ride
    app.registerHandler(
        "/api/v1/ride",
        [this](const HttpRequestPtr& req,
               std::function<void(const HttpResponsePtr&)>&& callback) {
            this->handleList(req, std::move(callback));
        },
        {Get});

    // POST /api/v1/ride
    app.registerHandler(
        "/api/v1/ride",
        [this](const HttpRequestPtr& req,
               std::function<void(const HttpResponsePtr&)>&& callback) {
            this->handleCreate(req, std::move(callback));
        },
        {Post});

    // GET /api/v1/ride/{id}
    app.registerHandler(
        "/api/v1/ride/{id}",
        [this](const HttpRequestPtr& req,
               std::function<void(const HttpResponsePtr&)>&& callback,
               const std::string& id) {
            this->handleGetById(req, std::move(callback), id);
        },
        {Get});

    // PUT /api/v1/ride/{id}
    app.registerHandler(
        "/api/v1/ride/{id}",
        [this](const HttpRequestPtr& req,
               std::function<void(const HttpResponsePtr&)>&& callback,
               const std::string& id) {
            this->handleUpdate(req, std::move(callback), id);
        },
        {Put});

    // DELETE /api/v1/ride/{id}
    app.registerHandler(
        "/api/v1/ride/{id}",
        [this](const HttpRequestPtr& req,
               std::function<void(const HttpResponsePtr&)>&& callback,
               const std::string& id) {
            this->handleDelete(req, std::move(callback), id);
        },
        {Delete});

    spdlog::info("[RideHandler] Routes registered: GET/POST /api/v1/ride, "
                 "GET/PUT/DELETE /api/v1/ride/{{id}}");
}

void RideHandler::handleList(
    const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback) {

    try {
        auto ctx = authenticate(*authenticator_, req, auth::AccessMode::ReadOnly);
        auto page = pageRequest(req);

        auto result = rideService_->list(ctx.userId, page);

        Json::Value items(Json::arrayValue);
        for (const auto& ride : result.items) {
            items.append(toJson(ride));
        }
        callback(listResponse(req, items, result.totalItems, page));

    } catch (const std::exception& e) {
        callback(errorResponse("RideHandler", e));
    }
}

void RideHandler::handleCreate(
    const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback) {

    try {
        auto ctx = authenticate(*authenticator_, req, auth::AccessMode::ReadWrite);
        auto ride = rideFromJson(jsonBody(req));

        auto created = rideService_->create(ctx.userId, ride);
        callback(jsonResponse(toJson(created)));

    } catch (const std::exception& e) {
        callback(errorResponse("RideHandler", e));
    }
}

void RideHandler::handleGetById(
    const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback,
    const std::string& id) {

    try {
        uint32_t rideId = pathId(id);
        auto ctx = authenticate(*authenticator_, req, auth::AccessMode::ReadOnly);

        callback(jsonResponse(toJson(rideService_->get(ctx.userId, rideId))));

    } catch (const std::exception& e) {
        callback(errorResponse("RideHandler", e));
    }
}

void RideHandler::handleUpdate(
    const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback,
    const std::string& id) {

    try {
        uint32_t rideId = pathId(id);
        auto ctx = authenticate(*authenticator_, req, auth::AccessMode::ReadWrite);
        auto ride = rideFromJson(jsonBody(req));

        rideService_->update(ctx.userId, rideId, ride);
        callback(noContent());

    } catch (const std::exception& e) {
        callback(errorResponse("RideHandler", e));
    }
}

void RideHandler::handleDelete(
    const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback,
    const std::string& id) {

    try {
        uint32_t rideId = pathId(id);
        auto ctx = authenticate(*authenticator_, req, auth::AccessMode::ReadWrite);

        rideService_->remove(ctx.userId, rideId);
        callback(noContent());

    } catch (const std::exception& e) {
        callback(errorResponse("RideHandler", e));
    }
}

} // namespace handlers
