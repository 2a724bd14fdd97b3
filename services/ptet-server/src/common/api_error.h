#pragma once

/**
 * @file api_error.h
 * @brief Error returned to API clients
 *
 * Serialised as:
 * @code
 * {"error": {"code": 404, "reason": "Not found", "description": null}}
 * @endcode
 *
 * Domain exceptions thrown by repositories and models are translated with
 * fromException(): NotFound -> 404, Deserialization -> 400,
 * Database/Internal -> 500.
 *
 * @date 2026-03-25
 */

#include <optional>
#include <stdexcept>
#include <string>
#include <json/json.h>

namespace common {

class ApiError : public std::runtime_error {
public:
    explicit ApiError(int code, std::optional<std::string> description = std::nullopt);

    static ApiError notFound(std::optional<std::string> description = std::nullopt) {
        return ApiError(404, std::move(description));
    }
    static ApiError unauthorized(std::optional<std::string> description = std::nullopt) {
        return ApiError(401, std::move(description));
    }
    static ApiError badRequest(std::optional<std::string> description = std::nullopt) {
        return ApiError(400, std::move(description));
    }
    static ApiError internalServerError(std::optional<std::string> description = std::nullopt) {
        return ApiError(500, std::move(description));
    }

    /**
     * @brief Map any exception to the error the client gets to see
     */
    static ApiError fromException(const std::exception& e);

    /// Reason phrase for the supported status codes
    static std::string reasonFor(int code);

    int code() const { return code_; }
    std::string reason() const { return reasonFor(code_); }
    const std::optional<std::string>& description() const { return description_; }

    Json::Value toJson() const;

private:
    int code_;
    std::optional<std::string> description_;
};

} // namespace common
