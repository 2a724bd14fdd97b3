#pragma once

/**
 * @file openapi_document.h
 * @brief OpenAPI 3 description of the /api/v1 routes
 */

#include <string>
#include <json/json.h>

namespace handlers {

/**
 * @brief Build the OpenAPI document
 * @param version API version reported in info.version
 */
Json::Value buildOpenApiDocument(const std::string& version);

} // namespace handlers
