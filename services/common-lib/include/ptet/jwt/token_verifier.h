/**
 * @file token_verifier.h
 * @brief Signature and claim validation for JSON Web Tokens
 *
 * Checks run in a fixed order and stop at the first failure:
 * key ID, signature, issuer, audience, issuing time, validity window.
 * Each failure is reported as common::TokenException with a fixed message.
 *
 * A configured verifier holds no per-token state, so one instance can
 * verify any number of tokens.
 *
 * @date 2026-03-24
 */

#pragma once

#include "ptet/jwt/jwt_token.h"
#include "ptet/keys/key_cache.h"
#include "ptet/utils/time_utils.h"
#include <chrono>
#include <optional>
#include <string>

namespace ptet {
namespace jwt {

/// Token whose signature and claims passed verification
struct VerifiedToken {
    Token token;
    std::string keyId;   ///< key that signed the token
};

class TokenVerifier {
public:
    explicit TokenVerifier(keys::KeyCache& keyCache);

    TokenVerifier& expectKeyId(const std::string& keyId);
    TokenVerifier& expectIssuer(const std::string& issuer);
    TokenVerifier& expectAudience(const std::string& audience);

    /** Skip the nbf / iat / exp checks */
    TokenVerifier& disableTimeCheck();

    /** Reject tokens whose exp lies further than maxExpiration after iat */
    TokenVerifier& withMaxExpiration(std::chrono::seconds maxExpiration);

    /** Reject tokens issued (iat) before the given instant */
    TokenVerifier& mustBeIssuedAfter(const utils::TimePoint& issuedAfter);

    /** Evaluate time checks against a fixed instant instead of the clock */
    TokenVerifier& atTime(const utils::TimePoint& now);

    /**
     * @brief Verify a compact JWT
     * @throws common::TokenException on malformed tokens and failed checks
     * @throws common::KeyStoreException when the signing key cannot be loaded
     */
    VerifiedToken verify(const std::string& compact) const;

private:
    void checkClaims(const Token& token) const;

    keys::KeyCache& keyCache_;
    std::optional<std::string> keyId_;
    std::optional<std::string> issuer_;
    std::optional<std::string> audience_;
    bool checkTimes_ = true;
    std::optional<std::chrono::seconds> maxExpiration_;
    std::optional<utils::TimePoint> issuedAfter_;
    std::optional<utils::TimePoint> fixedNow_;
};

} // namespace jwt
} // namespace ptet
