#pragma once

/**
 * @file tag_handler.h
 * @brief HTTP handler for tag descriptors (/api/v1/tag)
 */

#include <drogon/drogon.h>
#include "../auth/request_authenticator.h"
#include "../services/tag_service.h"

namespace handlers {

class TagHandler {
public:
    TagHandler(services::TagService* tagService,
               auth::RequestAuthenticator* authenticator);
    ~TagHandler();

    void registerRoutes(drogon::HttpAppFramework& app);

private:
    services::TagService* tagService_;
    auth::RequestAuthenticator* authenticator_;

    /** GET /api/v1/tag - Tags of the caller, enum tags with their options */
    void handleList(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    /** POST /api/v1/tag - Create tag (a UUID is assigned) */
    void handleCreate(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    /** GET /api/v1/tag/{id} */
    void handleGetById(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback,
        const std::string& id);

    /** PUT /api/v1/tag/{id} */
    void handleUpdate(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback,
        const std::string& id);

    /** DELETE /api/v1/tag/{id} - Soft delete */
    void handleDelete(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback,
        const std::string& id);
};

} // namespace handlers
