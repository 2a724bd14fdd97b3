/**
 * @file api_error.cpp
 * @brief ApiError implementation
 */

#include "api_error.h"
#include "exceptions.h"

namespace common {

ApiError::ApiError(int code, std::optional<std::string> description)
    : std::runtime_error(description ? reasonFor(code) + ": " + *description : reasonFor(code)),
      code_(code),
      description_(std::move(description))
{
}

std::string ApiError::reasonFor(int code) {
    switch (code) {
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 404: return "Not found";
        case 500: return "Internal Server Error";
        default:  return "Error";
    }
}

ApiError ApiError::fromException(const std::exception& e) {
    if (auto apiError = dynamic_cast<const ApiError*>(&e)) {
        return *apiError;
    }
    if (dynamic_cast<const NotFoundException*>(&e)) {
        return notFound();
    }
    if (dynamic_cast<const DeserializationException*>(&e)) {
        return badRequest(std::string(e.what()));
    }
    if (dynamic_cast<const TokenException*>(&e)) {
        return unauthorized(std::string(e.what()));
    }
    return internalServerError(std::string(e.what()));
}

Json::Value ApiError::toJson() const {
    Json::Value info;
    info["code"] = code_;
    info["reason"] = reason();
    info["description"] = description_ ? Json::Value(*description_) : Json::Value(Json::nullValue);

    Json::Value body;
    body["error"] = info;
    return body;
}

} // namespace common
