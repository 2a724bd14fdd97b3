/**
 * @file test_app_config.cpp
 * @brief Tests for command-line configuration of the backend
 */

#include <gtest/gtest.h>
#include "exceptions.h"
#include "../src/infrastructure/app_config.h"
#include <cstdlib>
#include <vector>

class AppConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : {"ROCKET_ADDRESS", "PTET_ADDRESS", "ROCKET_PORT", "PTET_PORT",
                                 "PTET_THREADS", "PTET_LOG_LEVEL", "PTET_LOG_FILE"}) {
            unsetenv(name);
        }
    }

    AppConfig parse(std::vector<std::string> args) {
        args.insert(args.begin(), "public-transport-expense-tracker");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return AppConfig::fromCommandLine(static_cast<int>(argv.size()), argv.data());
    }

    std::vector<std::string> required() {
        return {"--database", "sqlite://db.sqlite?mode=rwc", "--keys-dir", "/keys",
                "--server-base-uri", "https://ptet.example.tld"};
    }
};

// --- Command line ---

TEST_F(AppConfigTest, RequiredFlags) {
    AppConfig config = parse(required());
    EXPECT_EQ(config.databaseUri, "sqlite://db.sqlite?mode=rwc");
    EXPECT_EQ(config.keysDir, "/keys");
    EXPECT_EQ(config.serverBaseUri, "https://ptet.example.tld");
    EXPECT_FALSE(config.expectJwtIssuer.has_value());
    EXPECT_EQ(config.jwtMaxExpiration, 31536000);
    EXPECT_EQ(config.address, "127.0.0.1");
    EXPECT_EQ(config.serverPort, 8000);
}

TEST_F(AppConfigTest, OptionalFlags) {
    auto args = required();
    args.insert(args.end(), {"--expect-jwt-issuer=issuer@example.tld",
                             "--jwt-issued-after", "2025-01-01T00:00:00Z",
                             "--jwt-max-expiration", "3600"});
    AppConfig config = parse(args);
    EXPECT_EQ(config.expectJwtIssuer, std::optional<std::string>("issuer@example.tld"));
    ASSERT_TRUE(config.jwtIssuedAfter.has_value());
    EXPECT_EQ(ptet::utils::formatRfc3339(*config.jwtIssuedAfter), "2025-01-01T00:00:00Z");
    EXPECT_EQ(config.jwtMaxExpiration, 3600);
}

TEST_F(AppConfigTest, ShortFlags) {
    AppConfig config = parse({"-d", "sqlite::memory:", "-k", "keys", "-u", "http://localhost:8000"});
    EXPECT_EQ(config.databaseUri, "sqlite::memory:");
    EXPECT_EQ(config.keysDir, "keys");
}

TEST_F(AppConfigTest, HelpSkipsValidation) {
    EXPECT_TRUE(parse({"--help"}).showHelp);
    EXPECT_TRUE(parse({"-V"}).showVersion);
}

TEST_F(AppConfigTest, Errors) {
    EXPECT_THROW(parse({}), common::ConfigException);
    EXPECT_THROW(parse({"--database", "sqlite::memory:", "--keys-dir", "k"}), common::ConfigException);

    auto unknown = required();
    unknown.push_back("--verbose");
    EXPECT_THROW(parse(unknown), common::ConfigException);

    auto missingValue = required();
    missingValue.push_back("--jwt-max-expiration");
    EXPECT_THROW(parse(missingValue), common::ConfigException);

    auto badTime = required();
    badTime.insert(badTime.end(), {"--jwt-issued-after", "yesterday"});
    EXPECT_THROW(parse(badTime), common::ConfigException);

    auto badSeconds = required();
    badSeconds.insert(badSeconds.end(), {"--jwt-max-expiration", "0"});
    EXPECT_THROW(parse(badSeconds), common::ConfigException);
}

// --- Environment ---

TEST_F(AppConfigTest, Environment) {
    setenv("ROCKET_ADDRESS", "0.0.0.0", 1);
    setenv("ROCKET_PORT", "9000", 1);
    setenv("PTET_THREADS", "1000", 1);
    setenv("PTET_LOG_LEVEL", "debug", 1);

    AppConfig config = parse(required());
    EXPECT_EQ(config.address, "0.0.0.0");
    EXPECT_EQ(config.serverPort, 9000);
    EXPECT_EQ(config.threadNum, 128);
    EXPECT_EQ(config.logLevel, "debug");

    setenv("PTET_PORT", "8080", 1);
    EXPECT_EQ(parse(required()).serverPort, 8080);

    setenv("PTET_PORT", "http", 1);
    EXPECT_EQ(parse(required()).serverPort, 8000);
}
