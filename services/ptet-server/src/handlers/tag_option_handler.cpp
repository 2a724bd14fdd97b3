/** @file tag_option_handler.cpp
 *  @brief TagOptionHandler implementation
 */

#include "tag_option_handler.h"
#include "handler_utils.h"
#include "model_json.h"
#include <spdlog/spdlog.h>

using namespace drogon;
using namespace common::handler;

namespace handlers {

TagOptionHandler::TagOptionHandler(services::TagService* tagService,
                                   auth::RequestAuthenticator* authenticator)
    : tagService_(tagService), authenticator_(authenticator) {
    spdlog::info("[TagOptionHandler] Initialized");
}

TagOptionHandler::~TagOptionHandler() {}

void TagOptionHandler::registerRoutes(HttpAppFramework& app) {
    // GET /api/v1/tag/{tag_id}/tag_option
    app.registerHandler(
        "/api/v1/tag/{tag_id}/tag_option",
        [this](const HttpRequestPtr& req,
               std::function<void(const HttpResponsePtr&)>&& callback,
               const std::string& tagId) {
            this->handleList(req, std::move(callback), tagId);
        },
        {Get});

    // POST /api/v1/tag/{tag_id}/tag_option
    app.registerHandler(
        "/api/v1/tag/{tag_id}/tag_option",
        [this](const HttpRequestPtr& req,
               std::function<void(const HttpResponsePtr&)>&& callback,
               const std::string& tagId) {
            this->handleCreate(req, std::move(callback), tagId);
        },
        {Post});

    // GET /api/v1/tag_option/{id}
    app.registerHandler(
        "/api/v1/tag_option/{id}",
        [this](const HttpRequestPtr& req,
               std::function<void(const HttpResponsePtr&)>&& callback,
               const std::string& id) {
            this->handleGetById(req, std::move(callback), id);
        },
        {Get});

    // PUT /api/v1/tag_option/{id}
    app.registerHandler(
        "/api/v1/tag_option/{id}",
        [this](const HttpRequestPtr& req,
               std::function<void(const HttpResponsePtr&)>&& callback,
               const std::string& id) {
            this->handleUpdate(req, std::move(callback), id);
        },
        {Put});

    // DELETE /api/v1/tag_option/{id}
    app.registerHandler(
        "/api/v1/tag_option/{id}",
        [this](const HttpRequestPtr& req,
               std::function<void(const HttpResponsePtr&)>&& callback,
               const std::string& id) {
            this->handleDelete(req, std::move(callback), id);
        },
        {Delete});

    spdlog::info("[TagOptionHandler] Routes registered: GET/POST /api/v1/tag/{{tag_id}}/tag_option, "
                 "GET/PUT/DELETE /api/v1/tag_option/{{id}}");
}

void TagOptionHandler::handleList(
    const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback,
    const std::string& tagId) {

    try {
        uint32_t parentId = pathId(tagId);
        auto ctx = authenticate(*authenticator_, req, auth::AccessMode::ReadOnly);
        auto page = pageRequest(req);

        auto result = tagService_->listOptions(ctx.userId, parentId, page);

        Json::Value items(Json::arrayValue);
        for (const auto& option : result.items) {
            items.append(toJson(option));
        }
        callback(listResponse(req, items, result.totalItems, page));

    } catch (const std::exception& e) {
        callback(errorResponse("TagOptionHandler", e));
    }
}

void TagOptionHandler::handleCreate(
    const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback,
    const std::string& tagId) {

    try {
        uint32_t parentId = pathId(tagId);
        auto ctx = authenticate(*authenticator_, req, auth::AccessMode::ReadWrite);
        auto option = tagOptionFromJson(jsonBody(req));

        auto created = tagService_->createOption(ctx.userId, parentId, option);
        callback(jsonResponse(toJson(created)));

    } catch (const std::exception& e) {
        callback(errorResponse("TagOptionHandler", e));
    }
}

void TagOptionHandler::handleGetById(
    const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback,
    const std::string& id) {

    try {
        uint32_t optionId = pathId(id);
        auto ctx = authenticate(*authenticator_, req, auth::AccessMode::ReadOnly);

        callback(jsonResponse(toJson(tagService_->getOption(ctx.userId, optionId))));

    } catch (const std::exception& e) {
        callback(errorResponse("TagOptionHandler", e));
    }
}

void TagOptionHandler::handleUpdate(
    const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback,
    const std::string& id) {

    try {
        uint32_t optionId = pathId(id);
        auto ctx = authenticate(*authenticator_, req, auth::AccessMode::ReadWrite);
        auto option = tagOptionFromJson(jsonBody(req));

        tagService_->updateOption(ctx.userId, optionId, option);
        callback(noContent());

    } catch (const std::exception& e) {
        callback(errorResponse("TagOptionHandler", e));
    }
}

void TagOptionHandler::handleDelete(
    const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback,
    const std::string& id) {

    try {
        uint32_t optionId = pathId(id);
        auto ctx = authenticate(*authenticator_, req, auth::AccessMode::ReadWrite);

        tagService_->removeOption(ctx.userId, optionId);
        callback(noContent());

    } catch (const std::exception& e) {
        callback(errorResponse("TagOptionHandler", e));
    }
}

} // namespace handlers
