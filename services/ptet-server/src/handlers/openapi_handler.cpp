/** @file openapi_handler.cpp
 *  @brief OpenApiHandler implementation
 */

#include "openapi_handler.h"
#include "openapi_document.h"
#include <spdlog/spdlog.h>

using namespace drogon;

namespace handlers {

OpenApiHandler::OpenApiHandler(const std::string& version)
    : document_(buildOpenApiDocument(version)) {
    spdlog::info("[OpenApiHandler] Initialized ({} paths)", document_["paths"].size());
}

void OpenApiHandler::registerRoutes(HttpAppFramework& app) {
    // GET /api/v1/openapi.json
    app.registerHandler(
        "/api/v1/openapi.json",
        [this](const HttpRequestPtr& /*req*/,
               std::function<void(const HttpResponsePtr&)>&& callback) {
            callback(HttpResponse::newHttpJsonResponse(document_));
        },
        {Get});

    spdlog::info("[OpenApiHandler] Routes registered: GET /api/v1/openapi.json");
}

} // namespace handlers
