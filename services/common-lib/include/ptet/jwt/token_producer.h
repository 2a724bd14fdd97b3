/**
 * @file token_producer.h
 * @brief Builder that signs new JSON Web Tokens
 *
 * Usage:
 * @code
 *   std::string jwt = TokenProducer(keyCache)
 *       .withIssuer("issuer@example.tld")
 *       .withAudience("https://ptet.example.tld")
 *       .withExpiration(utils::now() + std::chrono::hours(24 * 364))
 *       .withRandomTokenId()
 *       .produce("subject@example.tld");
 * @endcode
 *
 * @date 2026-03-24
 */

#pragma once

#include "ptet/keys/key_cache.h"
#include "ptet/utils/time_utils.h"
#include <optional>
#include <string>
#include <json/json.h>

namespace ptet {
namespace jwt {

class TokenProducer {
public:
    static constexpr size_t DEFAULT_TOKEN_ID_LEN = 20;

    explicit TokenProducer(keys::KeyCache& keyCache);

    /** Sign with this key instead of the default key */
    TokenProducer& withKeyId(const std::string& keyId);
    TokenProducer& withIssuer(const std::string& issuer);
    TokenProducer& withNotBefore(const utils::TimePoint& notBefore);
    TokenProducer& withExpiration(const utils::TimePoint& expiration);
    TokenProducer& withAudience(const std::string& audience);
    TokenProducer& withTokenId(const std::string& tokenId);
    TokenProducer& withRandomTokenId(size_t length = DEFAULT_TOKEN_ID_LEN);

    /** Add a private claim with a string value */
    TokenProducer& addClaimString(const std::string& claim, const std::string& value);

    /**
     * @brief Merge all members of a JSON object into the private claims
     * @throws common::TokenException "Expected JSON object" for any other JSON value
     */
    TokenProducer& addClaimsFromJson(const Json::Value& object);

    /** Same as addClaimsFromJson() for JSON text */
    TokenProducer& addClaimsFromJson(const std::string& jsonText);

    /**
     * @brief Sign a token for the subject
     *
     * @return compact serialisation "<header>.<claims>.<signature>"
     * @throws common::KeyStoreException when no signing key can be resolved
     * @throws common::TokenException on signing failure
     */
    std::string produce(const std::string& subject) const;

private:
    keys::KeyCache& keyCache_;
    std::optional<std::string> keyId_;
    std::optional<std::string> issuer_;
    std::optional<utils::TimePoint> notBefore_;
    std::optional<utils::TimePoint> expiration_;
    std::optional<std::string> audience_;
    std::optional<std::string> tokenId_;
    Json::Value additionalClaims_{Json::objectValue};
    utils::TimePoint now_;
};

} // namespace jwt
} // namespace ptet
