#pragma once

/**
 * @file app_config.h
 * @brief Backend configuration from the command line and environment
 *
 * Command line:
 *   --database, -d <uri>         sqlite://<path>[?mode=rwc|rw|ro] or sqlite::memory:
 *   --keys-dir, -k <path>        key directory created by `token create-key`
 *   --server-base-uri, -u <uri>  expected JWT audience
 *   --expect-jwt-issuer <iss>
 *   --jwt-issued-after <RFC 3339 date-time>
 *   --jwt-max-expiration <seconds>   (default 31536000)
 *
 * Environment: ROCKET_ADDRESS / PTET_ADDRESS, ROCKET_PORT / PTET_PORT,
 * PTET_THREADS, PTET_LOG_LEVEL, PTET_LOG_FILE. ROCKET_SECRET_KEY is
 * accepted for compatibility and not used.
 */

#include <string>
#include <optional>
#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "exceptions.h"
#include "ptet/utils/string_utils.h"
#include "ptet/utils/time_utils.h"

#ifndef PTET_VERSION
#define PTET_VERSION "0.1.0"
#endif

struct AppConfig {
    std::string databaseUri;
    std::string keysDir;
    std::string serverBaseUri;
    std::optional<std::string> expectJwtIssuer;
    std::optional<ptet::utils::TimePoint> jwtIssuedAfter;
    int64_t jwtMaxExpiration = 31536000;  // seconds

    std::string address = "127.0.0.1";
    int serverPort = 8000;
    int threadNum = 4;
    std::string logLevel = "info";
    std::optional<std::string> logFile;

    bool showHelp = false;
    bool showVersion = false;

    // Safe environment variable integer parser with range clamping
    static int envStoi(const char* val, int defaultVal, int minVal, int maxVal) {
        auto parsed = ptet::utils::parseInt64(val ? val : "");
        if (!parsed) {
            spdlog::warn("Invalid integer env value '{}', using default {}", val ? val : "", defaultVal);
            return defaultVal;
        }
        return static_cast<int>(std::clamp<int64_t>(*parsed, minVal, maxVal));
    }

    static AppConfig fromEnvironment() {
        AppConfig config;

        if (auto val = std::getenv("ROCKET_ADDRESS")) config.address = val;
        if (auto val = std::getenv("PTET_ADDRESS")) config.address = val;
        if (auto val = std::getenv("ROCKET_PORT")) config.serverPort = envStoi(val, 8000, 1, 65535);
        if (auto val = std::getenv("PTET_PORT")) config.serverPort = envStoi(val, 8000, 1, 65535);
        if (auto val = std::getenv("PTET_THREADS")) config.threadNum = envStoi(val, 4, 1, 128);
        if (auto val = std::getenv("PTET_LOG_LEVEL")) config.logLevel = val;
        if (auto val = std::getenv("PTET_LOG_FILE")) {
            if (*val != '\0') config.logFile = std::string(val);
        }

        return config;
    }

    /**
     * @brief Environment defaults overridden by command-line flags
     *
     * Flags take "--flag value" or "--flag=value".
     *
     * @throws common::ConfigException on unknown flags, missing values or
     *         missing required flags (not checked with --help/--version)
     */
    static AppConfig fromCommandLine(int argc, char* argv[]) {
        AppConfig config = fromEnvironment();

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            std::string inlineValue;
            bool hasInlineValue = false;

            if (ptet::utils::startsWith(arg, "--")) {
                size_t eq = arg.find('=');
                if (eq != std::string::npos) {
                    inlineValue = arg.substr(eq + 1);
                    arg = arg.substr(0, eq);
                    hasInlineValue = true;
                }
            }

            auto value = [&]() -> std::string {
                if (hasInlineValue) return inlineValue;
                if (i + 1 >= argc) {
                    throw common::ConfigException("Missing value for " + arg);
                }
                return argv[++i];
            };

            if (arg == "--help" || arg == "-h") {
                config.showHelp = true;
            } else if (arg == "--version" || arg == "-V") {
                config.showVersion = true;
            } else if (arg == "--database" || arg == "-d") {
                config.databaseUri = value();
            } else if (arg == "--keys-dir" || arg == "-k") {
                config.keysDir = value();
            } else if (arg == "--server-base-uri" || arg == "-u") {
                config.serverBaseUri = value();
            } else if (arg == "--expect-jwt-issuer") {
                config.expectJwtIssuer = value();
            } else if (arg == "--jwt-issued-after") {
                std::string text = value();
                auto tp = ptet::utils::parseRfc3339(text);
                if (!tp) {
                    throw common::ConfigException("--jwt-issued-after is not an RFC 3339 date-time: " + text);
                }
                config.jwtIssuedAfter = tp;
            } else if (arg == "--jwt-max-expiration") {
                std::string text = value();
                auto seconds = ptet::utils::parseInt64(text);
                if (!seconds || *seconds <= 0) {
                    throw common::ConfigException("--jwt-max-expiration must be a positive number of seconds: " + text);
                }
                config.jwtMaxExpiration = *seconds;
            } else {
                throw common::ConfigException("Unknown argument: " + arg);
            }
        }

        if (!config.showHelp && !config.showVersion) {
            config.validate();
        }
        return config;
    }

    void validate() const {
        if (databaseUri.empty()) {
            throw common::ConfigException("--database is required");
        }
        if (keysDir.empty()) {
            throw common::ConfigException("--keys-dir is required");
        }
        if (serverBaseUri.empty()) {
            throw common::ConfigException("--server-base-uri is required");
        }
    }

    static std::string usage(const std::string& program) {
        return "Usage: " + program + " [OPTIONS] --database <URI> --keys-dir <PATH> --server-base-uri <URI>\n"
               "\n"
               "Options:\n"
               "  -d, --database <URI>              sqlite://<path>[?mode=rwc|rw|ro] or sqlite::memory:\n"
               "  -k, --keys-dir <PATH>             Directory with the token signing keys\n"
               "  -u, --server-base-uri <URI>       Base URI of this server (expected JWT audience)\n"
               "      --expect-jwt-issuer <ISS>     Only accept tokens from this issuer\n"
               "      --jwt-issued-after <TIME>     Reject tokens issued before this RFC 3339 time\n"
               "      --jwt-max-expiration <SECS>   Maximum token lifetime [default: 31536000]\n"
               "  -h, --help                        Print help\n"
               "  -V, --version                     Print version\n"
               "\n"
               "Environment:\n"
               "  ROCKET_ADDRESS / PTET_ADDRESS     Listen address [default: 127.0.0.1]\n"
               "  ROCKET_PORT / PTET_PORT           Listen port [default: 8000]\n"
               "  PTET_THREADS                      HTTP worker threads [default: 4]\n"
               "  PTET_LOG_LEVEL                    trace|debug|info|warn|error [default: info]\n"
               "  PTET_LOG_FILE                     Also log to this rotating file\n";
    }
};
