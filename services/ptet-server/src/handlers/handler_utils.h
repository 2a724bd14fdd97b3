#pragma once

#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <json/json.h>
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include "../auth/request_authenticator.h"
#include "../common/api_error.h"
#include "../common/pagination.h"
#include "../common/path_id.h"

/**
 * @file handler_utils.h
 * @brief Shared request parsing and response building for the API handlers
 *
 * Provides:
 *   - pathId(): unsigned id from a path segment (404 otherwise)
 *   - authenticate(): Authorization header -> AuthContext
 *   - jsonResponse() / noContent() / listResponse()
 *   - errorResponse(): any exception -> {"error": {...}} with its status
 *
 * @date 2026-03-25
 */

namespace common::handler {

/** parsePathId() for handlers; 404 when the segment is not an id */
uint32_t pathId(const std::string& segment);

/**
 * Authenticate a request with its Authorization header.
 * @throws ApiError 401
 */
auth::AuthContext authenticate(const auth::RequestAuthenticator& authenticator,
                               const drogon::HttpRequestPtr& req,
                               auth::AccessMode mode);

/** Parse the request body as JSON (400 on failure) */
Json::Value jsonBody(const drogon::HttpRequestPtr& req);

drogon::HttpResponsePtr jsonResponse(const Json::Value& body,
                                     drogon::HttpStatusCode status = drogon::k200OK);

/** 204 No Content */
drogon::HttpResponsePtr noContent();

/**
 * JSON array response with X-Total-Items, plus page headers and Link when
 * a page was requested.
 */
drogon::HttpResponsePtr listResponse(const drogon::HttpRequestPtr& req,
                                     const Json::Value& items,
                                     int64_t totalItems,
                                     const std::optional<PageRequest>& page);

/** Page requested by the "page" and "size" query parameters, if any */
std::optional<PageRequest> pageRequest(const drogon::HttpRequestPtr& req);

/** Error body and status of an ApiError */
drogon::HttpResponsePtr errorResponse(const ApiError& error);

/**
 * Translate any exception into an error response.
 * Server errors are logged as errors, client errors at debug level.
 */
drogon::HttpResponsePtr errorResponse(const std::string& logContext, const std::exception& e);

} // namespace common::handler
