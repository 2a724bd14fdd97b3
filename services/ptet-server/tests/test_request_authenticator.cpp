/**
 * @file test_request_authenticator.cpp
 * @brief Tests for Bearer token authentication of API requests
 */

#include "test_database.h"
#include "exceptions.h"
#include "../src/auth/request_authenticator.h"
#include "../src/common/api_error.h"
#include <ptet/jwt/token_producer.h>
#include <ptet/keys/key_cache.h>
#include <ptet/utils/string_utils.h>
#include <filesystem>

namespace fs = std::filesystem;
using auth::AccessMode;
using auth::RequestAuthenticator;

namespace {
constexpr const char* kAudience = "https://ptet.example.tld";
constexpr const char* kIssuer = "issuer@example.tld";
}

class RequestAuthenticatorTest : public DatabaseTest {
protected:
    void SetUp() override {
        DatabaseTest::SetUp();
        keyDir = fs::temp_directory_path() / ("ptet_auth_" + ptet::utils::randomAlphanumeric(12));
        keyCache = std::make_unique<ptet::keys::KeyCache>(ptet::keys::KeyStore(keyDir));
        keyCache->createPrivateKey(std::string("server"), ptet::keys::KeyGenerator::rsa(2048));

        auth::AuthSettings settings;
        settings.audience = kAudience;
        settings.issuer = kIssuer;
        settings.maxExpiration = std::chrono::hours(24);
        authenticator = std::make_unique<RequestAuthenticator>(keyCache.get(), users.get(), settings);
    }

    void TearDown() override {
        authenticator.reset();
        keyCache.reset();
        std::error_code ec;
        fs::remove_all(keyDir, ec);
    }

    ptet::jwt::TokenProducer producer() {
        ptet::jwt::TokenProducer p(*keyCache);
        p.withIssuer(kIssuer)
         .withAudience(kAudience)
         .withExpiration(ptet::utils::now() + std::chrono::hours(1));
        return p;
    }

    std::string bearer(const std::string& token) { return "Bearer " + token; }

    void expectUnauthorized(const std::string& header, AccessMode mode, const std::string& description) {
        try {
            authenticator->authenticate(header, mode);
            FAIL() << "Expected 401: " << description;
        } catch (const common::ApiError& e) {
            EXPECT_EQ(e.code(), 401);
            EXPECT_EQ(e.description(), std::optional<std::string>(description));
        }
    }

    fs::path keyDir;
    std::unique_ptr<ptet::keys::KeyCache> keyCache;
    std::unique_ptr<RequestAuthenticator> authenticator;
};

// --- Header parsing ---

TEST_F(RequestAuthenticatorTest, BearerToken) {
    EXPECT_EQ(RequestAuthenticator::bearerToken("Bearer abc.def.ghi"), std::optional<std::string>("abc.def.ghi"));
    EXPECT_EQ(RequestAuthenticator::bearerToken("bearer  abc "), std::optional<std::string>("abc"));
    EXPECT_FALSE(RequestAuthenticator::bearerToken("Basic dXNlcjpwdw==").has_value());
    EXPECT_FALSE(RequestAuthenticator::bearerToken("Bearer").has_value());
    EXPECT_FALSE(RequestAuthenticator::bearerToken("Bearer   ").has_value());
}

TEST_F(RequestAuthenticatorTest, MissingOrMalformedHeader) {
    expectUnauthorized("", AccessMode::ReadOnly, "Missing Authorization header");
    expectUnauthorized("Token abc", AccessMode::ReadOnly, "Expected a Bearer token");
}

// --- Token checks ---

TEST_F(RequestAuthenticatorTest, ValidTokenCreatesUser) {
    std::string token = producer().produce("bob");
    auto context = authenticator->authenticate(bearer(token), AccessMode::ReadOnly);

    EXPECT_EQ(context.issuer, kIssuer);
    EXPECT_EQ(context.subject, "bob");
    EXPECT_FALSE(context.canWrite);

    auto user = users->findById(context.userId);
    ASSERT_TRUE(user.has_value());
    EXPECT_EQ(user->jwtSubject, "bob");

    // Same identity maps to the same user
    EXPECT_EQ(authenticator->authenticate(bearer(producer().produce("bob")), AccessMode::ReadOnly).userId,
              context.userId);
}

TEST_F(RequestAuthenticatorTest, ExistingUserIsReused) {
    std::string token = producer().produce("alice");
    EXPECT_EQ(authenticator->authenticate(bearer(token), AccessMode::ReadOnly).userId, userId);
}

TEST_F(RequestAuthenticatorTest, WriteClaimGrantsWrite) {
    std::string token = producer().addClaimsFromJson(std::string("{\"ptet:write\": true}")).produce("bob");
    auto context = authenticator->authenticate(bearer(token), AccessMode::ReadWrite);
    EXPECT_TRUE(context.canWrite);
}

TEST_F(RequestAuthenticatorTest, WriteWithoutClaimIsRejected) {
    std::string token = producer().produce("bob");
    expectUnauthorized(bearer(token), AccessMode::ReadWrite, "Write access is not granted by this token");

    std::string denied = producer().addClaimsFromJson(std::string("{\"ptet:write\": false}")).produce("bob");
    expectUnauthorized(bearer(denied), AccessMode::ReadWrite, "Write access is not granted by this token");
}

TEST_F(RequestAuthenticatorTest, WrongAudience) {
    std::string token = producer().withAudience("https://other.example.tld").produce("bob");
    expectUnauthorized(bearer(token), AccessMode::ReadOnly, "Audience does not match");
}

TEST_F(RequestAuthenticatorTest, WrongIssuer) {
    std::string token = producer().withIssuer("someone@else.tld").produce("bob");
    expectUnauthorized(bearer(token), AccessMode::ReadOnly, "Issuer does not match");
}

TEST_F(RequestAuthenticatorTest, ExpiredToken) {
    std::string token = producer().produce("bob");
    authenticator->setFixedTime(ptet::utils::now() + std::chrono::hours(2));
    expectUnauthorized(bearer(token), AccessMode::ReadOnly, "Token is expired");
}

TEST_F(RequestAuthenticatorTest, LifetimeAboveMaximum) {
    std::string token = producer().withExpiration(ptet::utils::now() + std::chrono::hours(48)).produce("bob");
    expectUnauthorized(bearer(token), AccessMode::ReadOnly,
                       "Token expiration time exceeds maximum allowed value");
}

TEST_F(RequestAuthenticatorTest, TamperedSignature) {
    std::string token = producer().produce("bob");
    char& c = token[token.rfind('.') + 10];
    c = c == 'A' ? 'B' : 'A';
    try {
        authenticator->authenticate(bearer(token), AccessMode::ReadOnly);
        FAIL() << "Expected 401";
    } catch (const common::ApiError& e) {
        EXPECT_EQ(e.code(), 401);
    }
}

TEST_F(RequestAuthenticatorTest, UnknownKeyIsUnauthorized) {
    std::string token = producer().produce("bob");

    // Replace the signing key so the token's kid no longer resolves
    authenticator.reset();
    keyCache.reset();
    std::error_code ec;
    fs::remove_all(keyDir, ec);
    keyCache = std::make_unique<ptet::keys::KeyCache>(ptet::keys::KeyStore(keyDir));
    keyCache->createPrivateKey(std::string("rotated"), ptet::keys::KeyGenerator::rsa(2048));
    auth::AuthSettings settings;
    settings.audience = kAudience;
    authenticator = std::make_unique<RequestAuthenticator>(keyCache.get(), users.get(), settings);

    try {
        authenticator->authenticate(bearer(token), AccessMode::ReadOnly);
        FAIL() << "Expected 401";
    } catch (const common::ApiError& e) {
        EXPECT_EQ(e.code(), 401);
    }
}

TEST_F(RequestAuthenticatorTest, NullDependencies) {
    auth::AuthSettings settings;
    EXPECT_THROW(RequestAuthenticator(nullptr, users.get(), settings), std::invalid_argument);
    EXPECT_THROW(RequestAuthenticator(keyCache.get(), nullptr, settings), std::invalid_argument);
}
