/**
 * @file test_token_commands.cpp
 * @brief Tests for the `token` tool sub-commands
 */

#include <gtest/gtest.h>
#include <ptet/keys/key_cache.h>
#include <ptet/utils/string_utils.h>
#include "exceptions.h"
#include "token_commands.h"
#include <algorithm>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using token_tool::runTokenTool;

class TokenCommandsTest : public ::testing::Test {
protected:
    static std::vector<std::string> outputLines(const std::string& text) {
        std::vector<std::string> lines;
        std::istringstream in(text);
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty()) {
                lines.push_back(line);
            }
        }
        return lines;
    }

    void SetUp() override {
        keyDir = fs::temp_directory_path() / ("ptet_tool_" + ptet::utils::randomAlphanumeric(12));
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(keyDir, ec);
    }

    int run(std::vector<std::string> args) {
        out.str("");
        err.str("");
        args.insert(args.begin(), {"--key-dir", keyDir.string()});
        return runTokenTool(args, out, err);
    }

    /// Last non-empty line of stdout
    std::string lastLine() const {
        auto lines = outputLines(out.str());
        return lines.empty() ? "" : lines.back();
    }

    fs::path keyDir;
    std::ostringstream out;
    std::ostringstream err;
};

// --- Claim arguments ---

TEST_F(TokenCommandsTest, ParseClaim_KeyValue) {
    auto claim = token_tool::parseClaimArgument("role=admin");
    EXPECT_EQ(claim.first, "role");
    EXPECT_EQ(claim.second, "admin");
}

TEST_F(TokenCommandsTest, ParseClaim_EmptyValue) {
    auto claim = token_tool::parseClaimArgument("note=");
    EXPECT_EQ(claim.first, "note");
    EXPECT_EQ(claim.second, "");
}

TEST_F(TokenCommandsTest, ParseClaim_MissingValue) {
    try {
        token_tool::parseClaimArgument("role");
        FAIL() << "Expected ConfigException";
    } catch (const common::ConfigException& e) {
        EXPECT_NE(std::string(e.what()).find("Cannot parse claim, missing value"), std::string::npos);
    }
}

TEST_F(TokenCommandsTest, ParseClaim_TooManyEquals) {
    try {
        token_tool::parseClaimArgument("a=b=c");
        FAIL() << "Expected ConfigException";
    } catch (const common::ConfigException& e) {
        EXPECT_NE(std::string(e.what()).find("Cannot parse claim, too many ="), std::string::npos);
    }
}

// --- Key management ---

TEST_F(TokenCommandsTest, CreateKey_PrintsIdAndPublicKey) {
    ASSERT_EQ(run({"create-key", "-k", "main"}), 0) << err.str();
    EXPECT_NE(out.str().find("Key ID: main"), std::string::npos);
    EXPECT_NE(out.str().find("Public Key:\n-----BEGIN PUBLIC KEY-----"), std::string::npos);
    EXPECT_TRUE(fs::exists(keyDir / "key_main" / "private.pem"));
}

TEST_F(TokenCommandsTest, CreateKey_RandomId) {
    ASSERT_EQ(run({"create-key"}), 0) << err.str();
    ASSERT_EQ(run({"list-keys"}), 0);
    EXPECT_EQ(lastLine().size(), ptet::keys::KeyCache::DEFAULT_KEY_ID_LEN);
}

TEST_F(TokenCommandsTest, CreateKey_DuplicateFails) {
    ASSERT_EQ(run({"create-key", "--key-id", "dup"}), 0);
    EXPECT_EQ(run({"create-key", "--key-id", "dup"}), 1);
    EXPECT_NE(err.str().find("Error: Key already exists"), std::string::npos);
}

TEST_F(TokenCommandsTest, ListKeys_OnePerLine) {
    ASSERT_EQ(run({"create-key", "-k", "one"}), 0);
    ASSERT_EQ(run({"create-key", "-k", "two"}), 0);
    ASSERT_EQ(run({"list-keys"}), 0);

    auto lines = outputLines(out.str());
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_TRUE((lines[0] == "one" && lines[1] == "two") || (lines[0] == "two" && lines[1] == "one"));
}

TEST_F(TokenCommandsTest, ShowPublic) {
    ASSERT_EQ(run({"create-key", "-k", "show"}), 0);
    ASSERT_EQ(run({"show-public", "show"}), 0) << err.str();
    EXPECT_EQ(out.str().rfind("-----BEGIN PUBLIC KEY-----", 0), 0u);
}

TEST_F(TokenCommandsTest, ShowPublic_UnknownKey) {
    ASSERT_EQ(run({"create-key", "-k", "known"}), 0);
    EXPECT_EQ(run({"show-public", "unknown"}), 1);
    EXPECT_NE(err.str().find("Error:"), std::string::npos);
}

// --- Tokens ---

TEST_F(TokenCommandsTest, CreateAndVerifyToken) {
    ASSERT_EQ(run({"create-key", "-k", "signer"}), 0);
    ASSERT_EQ(run({"create-token", "-i", "issuer@example.tld", "-a", "https://ptet.example.tld",
                   "-e", "2099-01-01T00:00:00Z", "-c", "role=user",
                   "--claims-json", "{\"ptet:write\":true}", "alice"}), 0) << err.str();
    std::string token = lastLine();
    EXPECT_EQ(std::count(token.begin(), token.end(), '.'), 2);

    ASSERT_EQ(run({"verify-token", "-k", "signer", "-i", "issuer@example.tld",
                   "-a", "https://ptet.example.tld", token}), 0) << err.str();
    EXPECT_NE(out.str().find("Token was signed with key: signer"), std::string::npos);
    EXPECT_NE(out.str().find("Token subject is: alice"), std::string::npos);
    EXPECT_NE(out.str().find("Token Web Token ID is: "), std::string::npos);
}

TEST_F(TokenCommandsTest, VerifyToken_WrongIssuer) {
    ASSERT_EQ(run({"create-key", "-k", "signer"}), 0);
    ASSERT_EQ(run({"create-token", "-i", "good", "-e", "2099-01-01T00:00:00Z", "bob"}), 0);
    std::string token = lastLine();

    EXPECT_EQ(run({"verify-token", "--expect-issuer=bad", token}), 1);
    EXPECT_NE(err.str().find("Error:"), std::string::npos);
}

TEST_F(TokenCommandsTest, VerifyToken_MaxExpirationExceeded) {
    ASSERT_EQ(run({"create-key", "-k", "signer"}), 0);
    ASSERT_EQ(run({"create-token", "-e", "2099-01-01T00:00:00Z", "bob"}), 0);
    std::string token = lastLine();

    EXPECT_EQ(run({"verify-token", "-e", "3600", token}), 1);
}

TEST_F(TokenCommandsTest, CreateToken_BadTime) {
    ASSERT_EQ(run({"create-key", "-k", "signer"}), 0);
    EXPECT_EQ(run({"create-token", "-n", "yesterday", "bob"}), 1);
    EXPECT_NE(err.str().find("not an RFC 3339 date-time"), std::string::npos);
}

TEST_F(TokenCommandsTest, CreateToken_MissingSubject) {
    ASSERT_EQ(run({"create-key", "-k", "signer"}), 0);
    EXPECT_EQ(run({"create-token", "-i", "issuer"}), 1);
    EXPECT_NE(err.str().find("requires a subject"), std::string::npos);
}

// --- Argument errors ---

TEST_F(TokenCommandsTest, Help) {
    EXPECT_EQ(run({"--help"}), 0);
    EXPECT_NE(out.str().find("create-token"), std::string::npos);
}

TEST_F(TokenCommandsTest, MissingCommand) {
    EXPECT_EQ(run({}), 1);
    EXPECT_NE(err.str().find("Missing command"), std::string::npos);
}

TEST_F(TokenCommandsTest, UnknownCommand) {
    EXPECT_EQ(run({"rotate-keys"}), 1);
    EXPECT_NE(err.str().find("Unknown command: rotate-keys"), std::string::npos);
}
