/** @file ride_tag_handler.cpp
 *  @brief RideTagHandler implementation
 */

#include "ride_tag_handler.h"
#include "handler_utils.h"
#include "model_json.h"
#include <spdlog/spdlog.h>

using namespace drogon;
using namespace common::handler;

namespace handlers {

RideTagHandler::RideTagHandler(services::RideTagService* rideTagService,
                               auth::RequestAuthenticator* authenticator)
    : rideTagService_(rideTagService), authenticator_(authenticator) {
    spdlog::info("[RideTagHandler] Initialized");
}

RideTagHandler::~RideTagHandler() {}

void RideTagHandler::registerRoutes(HttpAppFramework& app) {
    // GET /api/v1/ride/{ride_id}/ride_tags
    app.registerHandler(
        "/api/v1/ride/{ride_id}/ride_tags",
        [this](const HttpRequestPtr& req,
               std::function<void(const HttpResponsePtr&)>&& callback,
               const std::string& rideId) {
            this->handleList(req, std::move(callback), rideId);
        },
        {Get});

    // GET /api/v1/ride/{ride_id}/ride_tags/{tag_id}
    app.registerHandler(
        "/api/v1/ride/{ride_id}/ride_tags/{tag_id}",
        [this](const HttpRequestPtr& req,
               std::function<void(const HttpResponsePtr&)>&& callback,
               const std::string& rideId,
               const std::string& tagId) {
            this->handleGetByTag(req, std::move(callback), rideId, tagId);
        },
        {Get});

    // POST /api/v1/ride/{ride_id}/ride_tags/{tag_id}
    app.registerHandler(
        "/api/v1/ride/{ride_id}/ride_tags/{tag_id}",
        [this](const HttpRequestPtr& req,
               std::function<void(const HttpResponsePtr&)>&& callback,
               const std::string& rideId,
               const std::string& tagId) {
            this->handleCreate(req, std::move(callback), rideId, tagId);
        },
        {Post});

    // GET /api/v1/ride_tag/{link_id}
    app.registerHandler(
        "/api/v1/ride_tag/{link_id}",
        [this](const HttpRequestPtr& req,
               std::function<void(const HttpResponsePtr&)>&& callback,
               const std::string& linkId) {
            this->handleGetByLink(req, std::move(callback), linkId);
        },
        {Get});

    // PUT /api/v1/ride_tag/{link_id}
    app.registerHandler(
        "/api/v1/ride_tag/{link_id}",
        [this](const HttpRequestPtr& req,
               std::function<void(const HttpResponsePtr&)>&& callback,
               const std::string& linkId) {
            this->handleUpdate(req, std::move(callback), linkId);
        },
        {Put});

    // DELETE /api/v1/ride_tag/{link_id}
    app.registerHandler(
        "/api/v1/ride_tag/{link_id}",
        [this](const HttpRequestPtr& req,
               std::function<void(const HttpResponsePtr&)>&& callback,
               const std::string& linkId) {
            this->handleDelete(req, std::move(callback), linkId);
        },
        {Delete});

    spdlog::info("[RideTagHandler] Routes registered: GET /api/v1/ride/{{ride_id}}/ride_tags, "
                 "GET/POST /api/v1/ride/{{ride_id}}/ride_tags/{{tag_id}}, "
                 "GET/PUT/DELETE /api/v1/ride_tag/{{link_id}}");
}

void RideTagHandler::handleList(
    const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback,
    const std::string& rideId) {

    try {
        uint32_t ride = pathId(rideId);
        auto ctx = authenticate(*authenticator_, req, auth::AccessMode::ReadOnly);
        auto page = pageRequest(req);

        auto result = rideTagService_->list(ctx.userId, ride, page);

        Json::Value items(Json::arrayValue);
        for (const auto& item : result.items) {
            items.append(toJson(item));
        }
        callback(listResponse(req, items, result.totalItems, page));

    } catch (const std::exception& e) {
        callback(errorResponse("RideTagHandler", e));
    }
}

void RideTagHandler::handleGetByTag(
    const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback,
    const std::string& rideId,
    const std::string& tagId) {

    try {
        uint32_t ride = pathId(rideId);
        uint32_t tag = pathId(tagId);
        auto ctx = authenticate(*authenticator_, req, auth::AccessMode::ReadOnly);

        callback(jsonResponse(toJson(rideTagService_->getByTag(ctx.userId, ride, tag))));

    } catch (const std::exception& e) {
        callback(errorResponse("RideTagHandler", e));
    }
}

void RideTagHandler::handleCreate(
    const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback,
    const std::string& rideId,
    const std::string& tagId) {

    try {
        uint32_t ride = pathId(rideId);
        uint32_t tag = pathId(tagId);
        auto ctx = authenticate(*authenticator_, req, auth::AccessMode::ReadWrite);
        auto link = rideTagLinkFromJson(jsonBody(req));

        auto created = rideTagService_->create(ctx.userId, ride, tag, link);
        callback(jsonResponse(toJson(created)));

    } catch (const std::exception& e) {
        callback(errorResponse("RideTagHandler", e));
    }
}

void RideTagHandler::handleGetByLink(
    const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback,
    const std::string& linkId) {

    try {
        uint32_t link = pathId(linkId);
        auto ctx = authenticate(*authenticator_, req, auth::AccessMode::ReadOnly);

        callback(jsonResponse(toJson(rideTagService_->getByLink(ctx.userId, link))));

    } catch (const std::exception& e) {
        callback(errorResponse("RideTagHandler", e));
    }
}

void RideTagHandler::handleUpdate(
    const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback,
    const std::string& linkId) {

    try {
        uint32_t link = pathId(linkId);
        auto ctx = authenticate(*authenticator_, req, auth::AccessMode::ReadWrite);
        auto update = rideTagLinkFromJson(jsonBody(req));

        rideTagService_->update(ctx.userId, link, update);
        callback(noContent());

    } catch (const std::exception& e) {
        callback(errorResponse("RideTagHandler", e));
    }
}

void RideTagHandler::handleDelete(
    const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback,
    const std::string& linkId) {

    try {
        uint32_t link = pathId(linkId);
        auto ctx = authenticate(*authenticator_, req, auth::AccessMode::ReadWrite);

        rideTagService_->remove(ctx.userId, link);
        callback(noContent());

    } catch (const std::exception& e) {
        callback(errorResponse("RideTagHandler", e));
    }
}

} // namespace handlers
