#pragma once

/**
 * @file tag_option_handler.h
 * @brief HTTP handler for options of enum tags
 *
 * Options are listed and created below their tag
 * (/api/v1/tag/{tag_id}/tag_option) and addressed directly by id
 * (/api/v1/tag_option/{id}). Ownership follows the tag.
 */

#include <drogon/drogon.h>
#include "../auth/request_authenticator.h"
#include "../services/tag_service.h"

namespace handlers {

class TagOptionHandler {
public:
    TagOptionHandler(services::TagService* tagService,
                     auth::RequestAuthenticator* authenticator);
    ~TagOptionHandler();

    void registerRoutes(drogon::HttpAppFramework& app);

private:
    services::TagService* tagService_;
    auth::RequestAuthenticator* authenticator_;

    /** GET /api/v1/tag/{tag_id}/tag_option */
    void handleList(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback,
        const std::string& tagId);

    /** POST /api/v1/tag/{tag_id}/tag_option */
    void handleCreate(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback,
        const std::string& tagId);

    /** GET /api/v1/tag_option/{id} */
    void handleGetById(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback,
        const std::string& id);

    /** PUT /api/v1/tag_option/{id} */
    void handleUpdate(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback,
        const std::string& id);

    /** DELETE /api/v1/tag_option/{id} */
    void handleDelete(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback,
        const std::string& id);
};

} // namespace handlers
