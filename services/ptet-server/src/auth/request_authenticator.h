#pragma once

/**
 * @file request_authenticator.h
 * @brief Bearer token authentication for API requests
 *
 * Every data route passes the Authorization header through authenticate().
 * The token must verify against the key directory and carry iss and sub;
 * the (iss, sub) pair identifies the user, who is created on first sight.
 * Write routes additionally need the claim "ptet:write": true.
 *
 * @date 2026-03-25
 */

#include "ptet/jwt/token_verifier.h"
#include "ptet/keys/key_cache.h"
#include "ptet/utils/time_utils.h"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace repositories {
class UserRepository;
}

namespace auth {

enum class AccessMode {
    ReadOnly,
    ReadWrite
};

struct AuthSettings {
    std::string audience;                               ///< server base URI
    std::optional<std::string> issuer;
    std::optional<ptet::utils::TimePoint> issuedAfter;
    std::chrono::seconds maxExpiration{31536000};
};

/// Identity of an authenticated request
struct AuthContext {
    uint32_t userId = 0;
    std::string issuer;
    std::string subject;
    bool canWrite = false;
};

class RequestAuthenticator {
public:
    static constexpr const char* WRITE_CLAIM = "ptet:write";

    /**
     * @throws std::invalid_argument if keyCache or userRepository is nullptr
     */
    RequestAuthenticator(ptet::keys::KeyCache* keyCache,
                         repositories::UserRepository* userRepository,
                         const AuthSettings& settings);

    /**
     * @brief Authenticate the value of an Authorization header
     *
     * @throws common::ApiError 401 when the header is missing or not a
     *         Bearer token, the token fails verification, lacks iss/sub, or
     *         write access is requested without the write claim
     * @throws common::DatabaseException when the user lookup fails
     */
    AuthContext authenticate(const std::string& authorizationHeader, AccessMode mode) const;

    /// Token of a "Bearer <token>" header value (scheme case-insensitive)
    static std::optional<std::string> bearerToken(const std::string& authorizationHeader);

    /** Evaluate token times against a fixed instant (tests) */
    void setFixedTime(const ptet::utils::TimePoint& now) { verifier_.atTime(now); }

private:
    repositories::UserRepository* userRepository_;
    ptet::jwt::TokenVerifier verifier_;
};

} // namespace auth
