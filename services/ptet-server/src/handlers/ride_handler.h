#pragma once

/**
 * @file ride_handler.h
 * @brief HTTP handler for rides (/api/v1/ride)
 *
 * A caller only ever sees their own rides; foreign and deleted rides
 * answer 404.
 */

#include <drogon/drogon.h>
#include "../auth/request_authenticator.h"
#include "../services/ride_service.h"

namespace handlers {

class RideHandler {
public:
    RideHandler(services::RideService* rideService,
                auth::RequestAuthenticator* authenticator);
    ~RideHandler();

    void registerRoutes(drogon::HttpAppFramework& app);

private:
    services::RideService* rideService_;
    auth::RequestAuthenticator* authenticator_;

    /** GET /api/v1/ride - Rides of the caller (optional page/size) */
    void handleList(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    /** POST /api/v1/ride - Create ride */
    void handleCreate(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    /** GET /api/v1/ride/{id} */
    void handleGetById(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback,
        const std::string& id);

    /** PUT /api/v1/ride/{id} */
    void handleUpdate(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback,
        const std::string& id);

    /** DELETE /api/v1/ride/{id} - Soft delete */
    void handleDelete(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback,
        const std::string& id);
};

} // namespace handlers
