/** @file tag_handler.cpp
 *  @brief TagHandler implementation
 */

#include "tag_handler.h"
#include "handler_utils.h"
#include "model_json.h"
#include <spdlog/spdlog.h>

using namespace drogon;
using namespace common::handler;

namespace handlers {

TagHandler::TagHandler(services::TagService* tagService,
                       auth::RequestAuthenticator* authenticator)
    : tagService_(tagService), authenticator_(authenticator) {
    spdlog::info("[TagHandler] Initialized");
}

TagHandler::~TagHandler() {}

void TagHandler::registerRoutes(HttpAppFramework& app) {
    // GET /api/v1/tag
    app.registerHandler(
        "/api/v1/tag",
        [this](const HttpRequestPtr& req,
               std::function<void(const HttpResponsePtr&)>&& callback) {
            this->handleList(req, std::move(callback));
        },
        {Get});

    // POST /api/v1/tag
    app.registerHandler(
        "/api/v1/tag",
        [this](const HttpRequestPtr& req,
               std::function<void(const HttpResponsePtr&)>&& callback) {
            this->handleCreate(req, std::move(callback));
        },
        {Post});

    // GET /api/v1/tag/{id}
    app.registerHandler(
        "/api/v1/tag/{id}",
        [this](const HttpRequestPtr& req,
               std::function<void(const HttpResponsePtr&)>&& callback,
               const std::string& id) {
            this->handleGetById(req, std::move(callback), id);
        },
        {Get});

    // PUT /api/v1/tag/{id}
    app.registerHandler(
        "/api/v1/tag/{id}",
        [this](const HttpRequestPtr& req,
               std::function<void(const HttpResponsePtr&)>&& callback,
               const std::string& id) {
            this->handleUpdate(req, std::move(callback), id);
        },
        {Put});

    // DELETE /api/v1/tag/{id}
    app.registerHandler(
        "/api/v1/tag/{id}",
        [this](const HttpRequestPtr& req,
               std::function<void(const HttpResponsePtr&)>&& callback,
               const std::string& id) {
            this->handleDelete(req, std::move(callback), id);
        },
        {Delete});

    spdlog::info("[TagHandler] Routes registered: GET/POST /api/v1/tag, "
                 "GET/PUT/DELETE /api/v1/tag/{{id}}");
}

void TagHandler::handleList(
    const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback) {

    try {
        auto ctx = authenticate(*authenticator_, req, auth::AccessMode::ReadOnly);
        auto page = pageRequest(req);

        auto result = tagService_->list(ctx.userId, page);

        Json::Value items(Json::arrayValue);
        for (const auto& tag : result.items) {
            items.append(toJson(tag));
        }
        callback(listResponse(req, items, result.totalItems, page));

    } catch (const std::exception& e) {
        callback(errorResponse("TagHandler", e));
    }
}

void TagHandler::handleCreate(
    const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback) {

    try {
        auto ctx = authenticate(*authenticator_, req, auth::AccessMode::ReadWrite);
        auto tag = tagFromJson(jsonBody(req));

        auto created = tagService_->create(ctx.userId, tag);
        callback(jsonResponse(toJson(created)));

    } catch (const std::exception& e) {
        callback(errorResponse("TagHandler", e));
    }
}

void TagHandler::handleGetById(
    const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback,
    const std::string& id) {

    try {
        uint32_t tagId = pathId(id);
        auto ctx = authenticate(*authenticator_, req, auth::AccessMode::ReadOnly);

        callback(jsonResponse(toJson(tagService_->get(ctx.userId, tagId))));

    } catch (const std::exception& e) {
        callback(errorResponse("TagHandler", e));
    }
}

void TagHandler::handleUpdate(
    const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback,
    const std::string& id) {

    try {
        uint32_t tagId = pathId(id);
        auto ctx = authenticate(*authenticator_, req, auth::AccessMode::ReadWrite);
        auto tag = tagFromJson(jsonBody(req));

        tagService_->update(ctx.userId, tagId, tag);
        callback(noContent());

    } catch (const std::exception& e) {
        callback(errorResponse("TagHandler", e));
    }
}

void TagHandler::handleDelete(
    const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback,
    const std::string& id) {

    try {
        uint32_t tagId = pathId(id);
        auto ctx = authenticate(*authenticator_, req, auth::AccessMode::ReadWrite);

        tagService_->remove(ctx.userId, tagId);
        callback(noContent());

    } catch (const std::exception& e) {
        callback(errorResponse("TagHandler", e));
    }
}

} // namespace handlers
