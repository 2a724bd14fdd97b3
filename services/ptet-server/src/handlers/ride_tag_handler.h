#pragma once

/**
 * @file ride_tag_handler.h
 * @brief HTTP handler for tag values on rides
 *
 * Routes:
 *   /api/v1/ride/{ride_id}/ride_tags            list
 *   /api/v1/ride/{ride_id}/ride_tags/{tag_id}   get / create by tag
 *   /api/v1/ride_tag/{link_id}                  get / update / delete by link
 */

#include <drogon/drogon.h>
#include "../auth/request_authenticator.h"
#include "../services/ride_tag_service.h"

namespace handlers {

class RideTagHandler {
public:
    RideTagHandler(services::RideTagService* rideTagService,
                   auth::RequestAuthenticator* authenticator);
    ~RideTagHandler();

    void registerRoutes(drogon::HttpAppFramework& app);

private:
    services::RideTagService* rideTagService_;
    auth::RequestAuthenticator* authenticator_;

    void handleList(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback,
        const std::string& rideId);

    void handleGetByTag(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback,
        const std::string& rideId,
        const std::string& tagId);

    /** POST .../ride_tags/{tag_id} - 400 when the tag is already linked */
    void handleCreate(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback,
        const std::string& rideId,
        const std::string& tagId);

    void handleGetByLink(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback,
        const std::string& linkId);

    void handleUpdate(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback,
        const std::string& linkId);

    void handleDelete(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback,
        const std::string& linkId);
};

} // namespace handlers
