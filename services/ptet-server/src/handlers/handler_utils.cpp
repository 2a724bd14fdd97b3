/**
 * @file handler_utils.cpp
 * @brief Handler helper implementation
 */

#include "handler_utils.h"
#include "model_json.h"
#include <spdlog/spdlog.h>

namespace common::handler {

uint32_t pathId(const std::string& segment) {
    return parsePathId(segment);
}

auth::AuthContext authenticate(const auth::RequestAuthenticator& authenticator,
                               const drogon::HttpRequestPtr& req,
                               auth::AccessMode mode) {
    return authenticator.authenticate(req->getHeader("Authorization"), mode);
}

Json::Value jsonBody(const drogon::HttpRequestPtr& req) {
    return handlers::parseJsonBody(std::string(req->body()));
}

drogon::HttpResponsePtr jsonResponse(const Json::Value& body, drogon::HttpStatusCode status) {
    auto resp = drogon::HttpResponse::newHttpJsonResponse(body);
    resp->setStatusCode(status);
    return resp;
}

drogon::HttpResponsePtr noContent() {
    auto resp = drogon::HttpResponse::newHttpResponse();
    resp->setStatusCode(drogon::k204NoContent);
    return resp;
}

std::optional<PageRequest> pageRequest(const drogon::HttpRequestPtr& req) {
    return parsePageRequest(req->getParameter("page"), req->getParameter("size"));
}

drogon::HttpResponsePtr listResponse(const drogon::HttpRequestPtr& req,
                                     const Json::Value& items,
                                     int64_t totalItems,
                                     const std::optional<PageRequest>& page) {
    auto resp = jsonResponse(items);
    uint64_t total = totalItems > 0 ? static_cast<uint64_t>(totalItems) : 0;
    HeaderList headers = page ? pageHeaders(req->path(), total, *page) : completeHeaders(total);
    for (const auto& [name, value] : headers) {
        resp->addHeader(name, value);
    }
    return resp;
}

drogon::HttpResponsePtr errorResponse(const ApiError& error) {
    return jsonResponse(error.toJson(), static_cast<drogon::HttpStatusCode>(error.code()));
}

drogon::HttpResponsePtr errorResponse(const std::string& logContext, const std::exception& e) {
    ApiError error = ApiError::fromException(e);
    if (error.code() >= 500) {
        spdlog::error("[{}] {}", logContext, e.what());
    } else {
        spdlog::debug("[{}] {} -> {}", logContext, e.what(), error.code());
    }
    return errorResponse(error);
}

} // namespace common::handler
