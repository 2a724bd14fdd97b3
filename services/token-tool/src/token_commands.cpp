/**
 * @file token_commands.cpp
 * @brief Argument parsing and execution of the `token` sub-commands
 */

#include "token_commands.h"

#include <ptet/jwt/token_producer.h>
#include <ptet/jwt/token_verifier.h>
#include <ptet/keys/key_cache.h>
#include <ptet/keys/key_generator.h>
#include <ptet/keys/pkey.h>
#include <ptet/utils/string_utils.h>
#include <ptet/utils/time_utils.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <optional>
#include <ostream>
#include <sstream>

#include "exceptions.h"

namespace token_tool {

namespace {

/**
 * @brief Walks one command's arguments, accepting `--flag value` and `--flag=value`
 */
class ArgCursor {
public:
    ArgCursor(const std::vector<std::string>& args, size_t start)
        : args_(args), pos_(start) {}

    bool next() {
        if (pos_ >= args_.size()) return false;
        arg_ = args_[pos_++];
        hasInline_ = false;
        if (ptet::utils::startsWith(arg_, "--")) {
            size_t eq = arg_.find('=');
            if (eq != std::string::npos) {
                inline_ = arg_.substr(eq + 1);
                arg_ = arg_.substr(0, eq);
                hasInline_ = true;
            }
        }
        return true;
    }

    const std::string& arg() const { return arg_; }

    bool isOption() const { return arg_.size() > 1 && arg_[0] == '-'; }

    bool is(const char* shortName, const char* longName) const {
        return (shortName && arg_ == shortName) || arg_ == longName;
    }

    std::string value() {
        if (hasInline_) return inline_;
        if (pos_ >= args_.size()) {
            throw common::ConfigException("Missing value for " + arg_);
        }
        return args_[pos_++];
    }

    size_t position() const { return pos_; }

private:
    const std::vector<std::string>& args_;
    size_t pos_;
    std::string arg_;
    std::string inline_;
    bool hasInline_ = false;
};

ptet::utils::TimePoint timeValue(const std::string& option, const std::string& text) {
    auto tp = ptet::utils::parseRfc3339(text);
    if (!tp) {
        throw common::ConfigException(option + " is not an RFC 3339 date-time: " + text);
    }
    return *tp;
}

void requirePositional(std::optional<std::string>& slot, const std::string& arg, const char* what) {
    if (slot) {
        throw common::ConfigException(std::string("Unexpected argument after ") + what + ": " + arg);
    }
    slot = arg;
}

// --- create-key ---

int createKey(ptet::keys::KeyCache& keyCache, ArgCursor& cursor, std::ostream& out) {
    std::optional<std::string> keyId;
    while (cursor.next()) {
        if (cursor.is("-k", "--key-id")) {
            keyId = cursor.value();
        } else {
            throw common::ConfigException("Unknown argument for create-key: " + cursor.arg());
        }
    }

    auto resolved = keyCache.createPrivateKey(keyId, ptet::keys::KeyGenerator::rsa(KEY_BITS));
    out << "Key ID: " << resolved.keyId << "\n";
    out << "Public Key:\n" << ptet::keys::publicKeyToPem(resolved.key.get()) << std::endl;
    return 0;
}

// --- list-keys ---

int listKeys(ptet::keys::KeyCache& keyCache, ArgCursor& cursor, std::ostream& out) {
    if (cursor.next()) {
        throw common::ConfigException("Unknown argument for list-keys: " + cursor.arg());
    }
    for (const auto& keyId : keyCache.keyIdList()) {
        out << keyId << "\n";
    }
    out.flush();
    return 0;
}

// --- show-public ---

int showPublic(ptet::keys::KeyCache& keyCache, ArgCursor& cursor, std::ostream& out) {
    std::optional<std::string> keyId;
    while (cursor.next()) {
        if (cursor.isOption()) {
            throw common::ConfigException("Unknown argument for show-public: " + cursor.arg());
        }
        requirePositional(keyId, cursor.arg(), "key ID");
    }
    if (!keyId) {
        throw common::ConfigException("show-public requires a key ID");
    }

    auto resolved = keyCache.getPublicKey(*keyId);
    out << ptet::keys::publicKeyToPem(resolved.key.get()) << std::endl;
    return 0;
}

// --- create-token ---

int createToken(ptet::keys::KeyCache& keyCache, ArgCursor& cursor, std::ostream& out) {
    ptet::jwt::TokenProducer producer(keyCache);
    std::optional<std::string> claimsJson;
    std::optional<std::string> subject;

    while (cursor.next()) {
        if (cursor.is("-k", "--key-id")) {
            producer.withKeyId(cursor.value());
        } else if (cursor.is("-i", "--issuer")) {
            producer.withIssuer(cursor.value());
        } else if (cursor.is("-a", "--audience")) {
            producer.withAudience(cursor.value());
        } else if (cursor.is("-n", "--not-before")) {
            std::string option = cursor.arg();
            producer.withNotBefore(timeValue(option, cursor.value()));
        } else if (cursor.is("-e", "--expiration")) {
            std::string option = cursor.arg();
            producer.withExpiration(timeValue(option, cursor.value()));
        } else if (cursor.is("-c", "--claim")) {
            auto claim = parseClaimArgument(cursor.value());
            producer.addClaimString(claim.first, claim.second);
        } else if (cursor.is(nullptr, "--claims-json")) {
            claimsJson = cursor.value();
        } else if (cursor.isOption()) {
            throw common::ConfigException("Unknown argument for create-token: " + cursor.arg());
        } else {
            requirePositional(subject, cursor.arg(), "subject");
        }
    }
    if (!subject) {
        throw common::ConfigException("create-token requires a subject");
    }

    // JSON claims are applied last and may override -c claims
    if (claimsJson) {
        producer.addClaimsFromJson(*claimsJson);
    }

    out << producer.produce(*subject) << std::endl;
    return 0;
}

// --- verify-token ---

int verifyToken(ptet::keys::KeyCache& keyCache, ArgCursor& cursor, std::ostream& out) {
    ptet::jwt::TokenVerifier verifier(keyCache);
    std::optional<std::string> compact;

    while (cursor.next()) {
        if (cursor.is("-k", "--expect-key-id")) {
            verifier.expectKeyId(cursor.value());
        } else if (cursor.is("-i", "--expect-issuer")) {
            verifier.expectIssuer(cursor.value());
        } else if (cursor.is("-a", "--expect-audience")) {
            verifier.expectAudience(cursor.value());
        } else if (cursor.is("-e", "--max-expiration")) {
            std::string text = cursor.value();
            auto seconds = ptet::utils::parseInt64(text);
            if (!seconds) {
                throw common::ConfigException("--max-expiration must be a number of seconds: " + text);
            }
            verifier.withMaxExpiration(std::chrono::seconds(*seconds));
        } else if (cursor.isOption()) {
            throw common::ConfigException("Unknown argument for verify-token: " + cursor.arg());
        } else {
            requirePositional(compact, cursor.arg(), "token");
        }
    }
    if (!compact) {
        throw common::ConfigException("verify-token requires a token");
    }

    auto verified = verifier.verify(*compact);
    out << "Token was signed with key: " << verified.keyId << "\n";
    if (auto subject = verified.token.subject()) {
        out << "Token subject is: " << *subject << "\n";
    }
    if (auto tokenId = verified.token.tokenId()) {
        out << "Token Web Token ID is: " << *tokenId << "\n";
    }
    out.flush();
    return 0;
}

} // namespace

std::pair<std::string, std::string> parseClaimArgument(const std::string& argument) {
    size_t eq = argument.find('=');
    if (eq == std::string::npos) {
        throw common::ConfigException("Cannot parse claim, missing value");
    }
    if (argument.find('=', eq + 1) != std::string::npos) {
        throw common::ConfigException("Cannot parse claim, too many =");
    }
    return {argument.substr(0, eq), argument.substr(eq + 1)};
}

std::string usage(const std::string& program) {
    std::ostringstream os;
    os << "Usage: " << program << " [-k|--key-dir DIR] <command> [args]\n"
       << "\n"
       << "Options:\n"
       << "  -k, --key-dir DIR           Path to the keys (default: " << DEFAULT_KEY_DIR << ")\n"
       << "  -h, --help                  Show this help\n"
       << "\n"
       << "Commands:\n"
       << "  create-key [-k ID]          Create a new RSA key (random ID when omitted)\n"
       << "  list-keys                   List key IDs\n"
       << "  show-public KEY_ID          Print the public key PEM\n"
       << "  create-token [options] SUBJECT\n"
       << "      -k, --key-id ID         Signing key (default key when omitted)\n"
       << "      -i, --issuer ISS        Issuer claim\n"
       << "      -a, --audience AUD      Audience claim\n"
       << "      -n, --not-before TIME   Not-before date-time (RFC 3339)\n"
       << "      -e, --expiration TIME   Expiration date-time (RFC 3339)\n"
       << "      -c, --claim KEY=VALUE   Additional string claim, repeatable\n"
       << "      --claims-json JSON      Additional claims as a JSON object\n"
       << "  verify-token [options] TOKEN\n"
       << "      -k, --expect-key-id ID  Require the signing key\n"
       << "      -i, --expect-issuer ISS Require the issuer\n"
       << "      -a, --expect-audience AUD\n"
       << "                              Require the audience\n"
       << "      -e, --max-expiration S  Maximum token lifetime in seconds\n";
    return os.str();
}

int runTokenTool(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    try {
        std::string keyDir = DEFAULT_KEY_DIR;
        std::optional<std::string> command;

        ArgCursor cursor(args, 0);
        while (!command && cursor.next()) {
            if (cursor.is("-h", "--help")) {
                out << usage("token");
                return 0;
            } else if (cursor.is("-k", "--key-dir")) {
                keyDir = cursor.value();
            } else if (cursor.isOption()) {
                throw common::ConfigException("Unknown argument: " + cursor.arg());
            } else {
                command = cursor.arg();
            }
        }
        if (!command) {
            throw common::ConfigException("Missing command");
        }

        spdlog::debug("[token] command={}, key dir={}", *command, keyDir);
        auto keyCache = ptet::keys::KeyCache::fromPath(keyDir);

        if (*command == "create-key") return createKey(keyCache, cursor, out);
        if (*command == "list-keys") return listKeys(keyCache, cursor, out);
        if (*command == "show-public") return showPublic(keyCache, cursor, out);
        if (*command == "create-token") return createToken(keyCache, cursor, out);
        if (*command == "verify-token") return verifyToken(keyCache, cursor, out);

        throw common::ConfigException("Unknown command: " + *command);
    } catch (const common::ConfigException& e) {
        err << "Error: " << e.what() << "\n\n" << usage("token");
        return 1;
    } catch (const std::exception& e) {
        err << "Error: " << e.what() << std::endl;
        return 1;
    }
}

} // namespace token_tool
