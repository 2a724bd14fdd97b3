/**
 * @file request_authenticator.cpp
 * @brief RequestAuthenticator implementation
 */

#include "request_authenticator.h"
#include "../common/api_error.h"
#include "../repositories/user_repository.h"
#include "exceptions.h"
#include "ptet/utils/string_utils.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace auth {

RequestAuthenticator::RequestAuthenticator(ptet::keys::KeyCache* keyCache,
                                           repositories::UserRepository* userRepository,
                                           const AuthSettings& settings)
    : userRepository_(userRepository),
      verifier_(keyCache ? *keyCache
                         : throw std::invalid_argument("RequestAuthenticator: keyCache cannot be nullptr"))
{
    if (!userRepository_) {
        throw std::invalid_argument("RequestAuthenticator: userRepository cannot be nullptr");
    }

    verifier_.expectAudience(settings.audience)
             .withMaxExpiration(settings.maxExpiration);
    if (settings.issuer) {
        verifier_.expectIssuer(*settings.issuer);
    }
    if (settings.issuedAfter) {
        verifier_.mustBeIssuedAfter(*settings.issuedAfter);
    }

    spdlog::info("[RequestAuthenticator] Audience: {}, issuer: {}, max expiration: {}s",
                 settings.audience, settings.issuer.value_or("<any>"),
                 settings.maxExpiration.count());
}

std::optional<std::string> RequestAuthenticator::bearerToken(const std::string& authorizationHeader) {
    std::string header = ptet::utils::trim(authorizationHeader);
    size_t space = header.find(' ');
    if (space == std::string::npos) {
        return std::nullopt;
    }
    if (ptet::utils::toLower(header.substr(0, space)) != "bearer") {
        return std::nullopt;
    }
    std::string token = ptet::utils::trim(header.substr(space + 1));
    if (token.empty()) {
        return std::nullopt;
    }
    return token;
}

AuthContext RequestAuthenticator::authenticate(const std::string& authorizationHeader,
                                               AccessMode mode) const {
    if (authorizationHeader.empty()) {
        spdlog::warn("[RequestAuthenticator] Request without Authorization header");
        throw common::ApiError::unauthorized("Missing Authorization header");
    }

    auto token = bearerToken(authorizationHeader);
    if (!token) {
        spdlog::warn("[RequestAuthenticator] Authorization header is not a Bearer token");
        throw common::ApiError::unauthorized("Expected a Bearer token");
    }

    ptet::jwt::VerifiedToken verified;
    try {
        verified = verifier_.verify(*token);
    } catch (const common::TokenException& e) {
        spdlog::warn("[RequestAuthenticator] Token rejected: {}", e.what());
        throw common::ApiError::unauthorized(std::string(e.what()));
    } catch (const common::KeyStoreException& e) {
        spdlog::warn("[RequestAuthenticator] Token key not usable: {}", e.what());
        throw common::ApiError::unauthorized(std::string(e.what()));
    }

    auto issuer = verified.token.issuer();
    auto subject = verified.token.subject();
    if (!issuer || !subject) {
        spdlog::warn("[RequestAuthenticator] Token signed with key {} lacks iss or sub", verified.keyId);
        throw common::ApiError::unauthorized("Token must contain issuer and subject");
    }

    AuthContext context;
    context.issuer = *issuer;
    context.subject = *subject;
    context.canWrite = verified.token.claimIsTrue(WRITE_CLAIM);

    if (mode == AccessMode::ReadWrite && !context.canWrite) {
        spdlog::warn("[RequestAuthenticator] Write access denied for {} / {}", *issuer, *subject);
        throw common::ApiError::unauthorized("Write access is not granted by this token");
    }

    context.userId = userRepository_->findOrCreate(*issuer, *subject).id;
    return context;
}

} // namespace auth
