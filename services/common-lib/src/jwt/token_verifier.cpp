/**
 * @file token_verifier.cpp
 * @brief TokenVerifier implementation
 */

#include "ptet/jwt/token_verifier.h"
#include "jose_signature.h"
#include "exceptions.h"
#include "shared/util/Base64Util.hpp"
#include <spdlog/spdlog.h>

namespace ptet {
namespace jwt {

using shared::util::Base64Util;

TokenVerifier::TokenVerifier(keys::KeyCache& keyCache)
    : keyCache_(keyCache)
{
}

TokenVerifier& TokenVerifier::expectKeyId(const std::string& keyId) {
    keyId_ = keyId;
    return *this;
}

TokenVerifier& TokenVerifier::expectIssuer(const std::string& issuer) {
    issuer_ = issuer;
    return *this;
}

TokenVerifier& TokenVerifier::expectAudience(const std::string& audience) {
    audience_ = audience;
    return *this;
}

TokenVerifier& TokenVerifier::disableTimeCheck() {
    checkTimes_ = false;
    return *this;
}

TokenVerifier& TokenVerifier::withMaxExpiration(std::chrono::seconds maxExpiration) {
    maxExpiration_ = maxExpiration;
    return *this;
}

TokenVerifier& TokenVerifier::mustBeIssuedAfter(const utils::TimePoint& issuedAfter) {
    issuedAfter_ = issuedAfter;
    return *this;
}

TokenVerifier& TokenVerifier::atTime(const utils::TimePoint& now) {
    fixedNow_ = now;
    return *this;
}

VerifiedToken TokenVerifier::verify(const std::string& compact) const {
    CompactParts parts = Token::split(compact);
    Token token = Token::parseUnverified(parts);

    keys::ResolvedKey publicKey = keyCache_.getPublicKey(token.keyId());

    if (keyId_ && *keyId_ != publicKey.keyId) {
        throw common::TokenException("Key ID does not match");
    }

    std::vector<uint8_t> signature;
    try {
        signature = Base64Util::decodeUrl(parts.signatureB64);
    } catch (const std::runtime_error&) {
        throw common::TokenException("Invalid token signature");
    }

    auto alg = token.algorithm();
    if (!alg || *alg != jose::algorithmFor(publicKey.key.get()) ||
        !jose::verify(publicKey.key.get(), parts.signingInput(), signature)) {
        throw common::TokenException("Invalid token signature");
    }

    checkClaims(token);

    spdlog::debug("[TokenVerifier] Verified token of '{}' signed with key '{}'",
                  token.subject().value_or(""), publicKey.keyId);
    return VerifiedToken{std::move(token), publicKey.keyId};
}

void TokenVerifier::checkClaims(const Token& token) const {
    if (issuer_) {
        auto issuer = token.issuer();
        if (!issuer) {
            throw common::TokenException("Issuer not set in token");
        }
        if (*issuer != *issuer_) {
            throw common::TokenException("Issuer does not match");
        }
    }

    if (audience_) {
        auto audience = token.audience();
        if (!audience) {
            throw common::TokenException("Audience not set in token");
        }
        if (*audience != *audience_) {
            throw common::TokenException("Audience does not match");
        }
    }

    if (issuedAfter_) {
        auto issuedAt = token.issuedAt();
        if (!issuedAt) {
            throw common::TokenException("Issued at not set in token");
        }
        if (*issuedAt < utils::toUnixSeconds(*issuedAfter_)) {
            throw common::TokenException("Token was issued before the accepted issuing time");
        }
    }

    if (!checkTimes_) {
        return;
    }

    int64_t now = utils::toUnixSeconds(fixedNow_ ? *fixedNow_ : utils::now());

    auto notBefore = token.notBefore();
    if (notBefore && *notBefore > now) {
        throw common::TokenException("Token is not valid yet");
    }

    auto issuedAt = token.issuedAt();
    if (!issuedAt) {
        throw common::TokenException("Issued at not set in token");
    }

    auto expiration = token.expiration();
    if (!expiration) {
        throw common::TokenException("Token has no expiration time");
    }
    if (maxExpiration_ && *expiration > *issuedAt + maxExpiration_->count()) {
        throw common::TokenException("Token expiration time exceeds maximum allowed value");
    }
    if (*expiration < now) {
        throw common::TokenException("Token is expired");
    }
}

} // namespace jwt
} // namespace ptet
