/**
 * @file token_producer.cpp
 * @brief TokenProducer implementation
 */

#include "ptet/jwt/token_producer.h"
#include "ptet/jwt/jwt_token.h"
#include "ptet/utils/string_utils.h"
#include "jose_signature.h"
#include "exceptions.h"
#include "shared/util/Base64Util.hpp"
#include <spdlog/spdlog.h>

namespace ptet {
namespace jwt {

using shared::util::Base64Util;

TokenProducer::TokenProducer(keys::KeyCache& keyCache)
    : keyCache_(keyCache), now_(utils::now())
{
}

TokenProducer& TokenProducer::withKeyId(const std::string& keyId) {
    keyId_ = keyId;
    return *this;
}

TokenProducer& TokenProducer::withIssuer(const std::string& issuer) {
    issuer_ = issuer;
    return *this;
}

TokenProducer& TokenProducer::withNotBefore(const utils::TimePoint& notBefore) {
    notBefore_ = notBefore;
    return *this;
}

TokenProducer& TokenProducer::withExpiration(const utils::TimePoint& expiration) {
    expiration_ = expiration;
    return *this;
}

TokenProducer& TokenProducer::withAudience(const std::string& audience) {
    audience_ = audience;
    return *this;
}

TokenProducer& TokenProducer::withTokenId(const std::string& tokenId) {
    tokenId_ = tokenId;
    return *this;
}

TokenProducer& TokenProducer::withRandomTokenId(size_t length) {
    tokenId_ = utils::randomAlphanumeric(length);
    return *this;
}

TokenProducer& TokenProducer::addClaimString(const std::string& claim, const std::string& value) {
    additionalClaims_[claim] = value;
    return *this;
}

TokenProducer& TokenProducer::addClaimsFromJson(const Json::Value& object) {
    if (!object.isObject()) {
        throw common::TokenException("Expected JSON object");
    }
    for (const auto& name : object.getMemberNames()) {
        additionalClaims_[name] = object[name];
    }
    return *this;
}

TokenProducer& TokenProducer::addClaimsFromJson(const std::string& jsonText) {
    return addClaimsFromJson(parseJson(jsonText));
}

std::string TokenProducer::produce(const std::string& subject) const {
    keys::ResolvedKey signingKey = keyCache_.getPrivateKey(keyId_);

    Json::Value header(Json::objectValue);
    header["alg"] = jose::algorithmFor(signingKey.key.get());
    header["kid"] = signingKey.keyId;
    header["typ"] = "JWT";

    // Private claims first so registered claims cannot be overridden
    Json::Value claims = additionalClaims_;
    if (issuer_) claims["iss"] = *issuer_;
    claims["sub"] = subject;
    if (audience_) claims["aud"] = *audience_;
    claims["iat"] = Json::Int64(utils::toUnixSeconds(now_));
    if (notBefore_) claims["nbf"] = Json::Int64(utils::toUnixSeconds(*notBefore_));
    if (expiration_) claims["exp"] = Json::Int64(utils::toUnixSeconds(*expiration_));
    if (tokenId_) claims["jti"] = *tokenId_;

    std::string signingInput = Base64Util::encodeUrl(toCompactJson(header)) + "." +
                               Base64Util::encodeUrl(toCompactJson(claims));
    std::vector<uint8_t> signature = jose::sign(signingKey.key.get(), signingInput);

    spdlog::debug("[TokenProducer] Signed token for '{}' with key '{}' ({})",
                  subject, signingKey.keyId, header["alg"].asString());
    return signingInput + "." + Base64Util::encodeUrl(signature);
}

} // namespace jwt
} // namespace ptet
