#pragma once

/**
 * @file openapi_handler.h
 * @brief Serves the OpenAPI document at /api/v1/openapi.json (no authentication)
 *
 * The route doubles as the liveness probe of the container.
 */

#include <drogon/drogon.h>
#include <json/json.h>
#include <string>

namespace handlers {

class OpenApiHandler {
public:
    explicit OpenApiHandler(const std::string& version);

    void registerRoutes(drogon::HttpAppFramework& app);

private:
    Json::Value document_;
};

} // namespace handlers
