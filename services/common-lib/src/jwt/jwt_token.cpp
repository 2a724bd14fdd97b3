/**
 * @file jwt_token.cpp
 * @brief Token parsing and claim accessors
 */

#include "ptet/jwt/jwt_token.h"
#include "exceptions.h"
#include "shared/util/Base64Util.hpp"
#include <cmath>
#include <memory>
#include <sstream>

namespace ptet {
namespace jwt {

using shared::util::Base64Util;

std::string toCompactJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

Json::Value parseJson(const std::string& text) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value value;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &value, &errors)) {
        throw common::TokenException("Invalid JSON: " + errors);
    }
    return value;
}

CompactParts Token::split(const std::string& compact) {
    size_t first = compact.find('.');
    if (first == std::string::npos) {
        throw common::TokenException("Malformed token: expected three segments");
    }
    size_t second = compact.find('.', first + 1);
    if (second == std::string::npos || compact.find('.', second + 1) != std::string::npos) {
        throw common::TokenException("Malformed token: expected three segments");
    }

    CompactParts parts;
    parts.headerB64 = compact.substr(0, first);
    parts.claimsB64 = compact.substr(first + 1, second - first - 1);
    parts.signatureB64 = compact.substr(second + 1);
    if (parts.headerB64.empty() || parts.claimsB64.empty()) {
        throw common::TokenException("Malformed token: empty segment");
    }
    return parts;
}

Token Token::parseUnverified(const CompactParts& parts) {
    std::string headerJson;
    std::string claimsJson;
    try {
        headerJson = Base64Util::decodeUrlToString(parts.headerB64);
        claimsJson = Base64Util::decodeUrlToString(parts.claimsB64);
    } catch (const std::runtime_error& e) {
        throw common::TokenException(std::string("Malformed token: ") + e.what());
    }

    Json::Value header = parseJson(headerJson);
    Json::Value claims = parseJson(claimsJson);
    if (!header.isObject() || !claims.isObject()) {
        throw common::TokenException("Malformed token: header and claims must be JSON objects");
    }
    return Token(std::move(header), std::move(claims));
}

const Json::Value& Token::claim(const std::string& name) const {
    static const Json::Value null;
    if (!claims_.isMember(name)) {
        return null;
    }
    return claims_[name];
}

bool Token::claimIsTrue(const std::string& name) const {
    const Json::Value& value = claim(name);
    return value.isBool() && value.asBool();
}

std::optional<std::string> Token::stringField(const Json::Value& obj, const char* name) {
    if (!obj.isMember(name) || !obj[name].isString()) {
        return std::nullopt;
    }
    return obj[name].asString();
}

std::optional<int64_t> Token::numericField(const Json::Value& obj, const char* name) {
    if (!obj.isMember(name)) {
        return std::nullopt;
    }
    const Json::Value& value = obj[name];
    if (value.isInt64()) {
        return value.asInt64();
    }
    if (value.isDouble() && std::isfinite(value.asDouble())) {
        return static_cast<int64_t>(value.asDouble());
    }
    return std::nullopt;
}

} // namespace jwt
} // namespace ptet
