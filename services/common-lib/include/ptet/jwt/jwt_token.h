/**
 * @file jwt_token.h
 * @brief Decoded JSON Web Token (header and claims)
 *
 * Holds the JSON header and claim set of a compact JWT. Registered claims
 * (RFC 7519 section 4.1) are exposed through typed getters, everything
 * else is reachable through claim().
 *
 * @date 2026-03-24
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <json/json.h>

namespace ptet {
namespace jwt {

/**
 * @brief Compact JWT split into its three segments
 */
struct CompactParts {
    std::string headerB64;
    std::string claimsB64;
    std::string signatureB64;

    /** "<header>.<claims>", the signing input */
    std::string signingInput() const { return headerB64 + "." + claimsB64; }
};

class Token {
public:
    Token() = default;
    Token(Json::Value header, Json::Value claims)
        : header_(std::move(header)), claims_(std::move(claims)) {}

    /**
     * @brief Split a compact JWT into header, claims and signature segments
     * @throws common::TokenException when the token does not have three segments
     */
    static CompactParts split(const std::string& compact);

    /**
     * @brief Decode header and claims of a compact JWT without verifying it
     * @throws common::TokenException on malformed base64url or JSON
     */
    static Token parseUnverified(const CompactParts& parts);

    const Json::Value& header() const { return header_; }
    const Json::Value& claims() const { return claims_; }

    std::optional<std::string> algorithm() const { return stringField(header_, "alg"); }
    std::optional<std::string> keyId() const { return stringField(header_, "kid"); }

    std::optional<std::string> issuer() const { return stringField(claims_, "iss"); }
    std::optional<std::string> subject() const { return stringField(claims_, "sub"); }
    std::optional<std::string> audience() const { return stringField(claims_, "aud"); }
    std::optional<std::string> tokenId() const { return stringField(claims_, "jti"); }

    std::optional<int64_t> issuedAt() const { return numericField(claims_, "iat"); }
    std::optional<int64_t> notBefore() const { return numericField(claims_, "nbf"); }
    std::optional<int64_t> expiration() const { return numericField(claims_, "exp"); }

    /** Any claim by name; null value when absent */
    const Json::Value& claim(const std::string& name) const;

    /** True only when the claim exists and is the JSON literal true */
    bool claimIsTrue(const std::string& name) const;

private:
    static std::optional<std::string> stringField(const Json::Value& obj, const char* name);
    static std::optional<int64_t> numericField(const Json::Value& obj, const char* name);

    Json::Value header_{Json::objectValue};
    Json::Value claims_{Json::objectValue};
};

/**
 * @brief Serialise JSON without whitespace, as used in JWT segments
 */
std::string toCompactJson(const Json::Value& value);

/**
 * @brief Parse a JSON document
 * @throws common::TokenException with the parser's message
 */
Json::Value parseJson(const std::string& text);

} // namespace jwt
} // namespace ptet
