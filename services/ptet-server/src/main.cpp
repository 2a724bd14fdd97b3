/**
 * @file main.cpp
 * @brief Public Transport Expense Tracker - HTTP backend
 *
 * REST API under /api/v1 for rides, tags, tag options and ride tag values.
 * Clients authenticate with JWTs signed by keys from the key directory.
 *
 * @date 2026-03-25
 */

#include <drogon/drogon.h>
#include <spdlog/spdlog.h>
#include <iostream>

#include "logger.h"
#include "exceptions.h"
#include "infrastructure/app_config.h"
#include "infrastructure/service_container.h"
#include "handlers/handler_utils.h"
#include "handlers/user_handler.h"
#include "handlers/ride_handler.h"
#include "handlers/ride_tag_handler.h"
#include "handlers/tag_handler.h"
#include "handlers/tag_option_handler.h"
#include "handlers/openapi_handler.h"

namespace {

trantor::Logger::LogLevel drogonLogLevel(const std::string& level) {
    if (level == "trace") return trantor::Logger::kTrace;
    if (level == "debug") return trantor::Logger::kDebug;
    if (level == "warn") return trantor::Logger::kWarn;
    if (level == "error" || level == "critical" || level == "off") return trantor::Logger::kError;
    return trantor::Logger::kInfo;
}

void registerRoutes(drogon::HttpAppFramework& app, infrastructure::ServiceContainer& container) {
    container.userHandler()->registerRoutes(app);
    container.rideHandler()->registerRoutes(app);
    container.rideTagHandler()->registerRoutes(app);
    container.tagHandler()->registerRoutes(app);
    container.tagOptionHandler()->registerRoutes(app);
    container.openApiHandler()->registerRoutes(app);

    // Unknown routes answer with the API error body
    app.setCustom404Page(common::handler::errorResponse(common::ApiError::notFound()));
}

} // namespace

int main(int argc, char* argv[]) {
    AppConfig config;
    try {
        config = AppConfig::fromCommandLine(argc, argv);
    } catch (const common::ConfigException& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << AppConfig::usage(argv[0]);
        return 1;
    }

    if (config.showHelp) {
        std::cout << AppConfig::usage(argv[0]);
        return 0;
    }
    if (config.showVersion) {
        std::cout << "public-transport-expense-tracker " << PTET_VERSION << std::endl;
        return 0;
    }

    common::Logger::initialize("ptet-server", config.logLevel,
                               config.logFile.has_value(), config.logFile.value_or(""));

    spdlog::info("Starting Public Transport Expense Tracker {}", PTET_VERSION);
    spdlog::info("Database: {}", config.databaseUri);
    spdlog::info("Keys: {}", config.keysDir);
    spdlog::info("Base URI: {}", config.serverBaseUri);

    infrastructure::ServiceContainer container;
    if (!container.initialize(config)) {
        spdlog::critical("Initialization failed, exiting");
        return 1;
    }

    try {
        auto& app = drogon::app();

        // Server settings
        app.setLogLevel(drogonLogLevel(config.logLevel))
           .addListener(config.address, static_cast<uint16_t>(config.serverPort))
           .setThreadNum(config.threadNum)
           .setClientMaxBodySize(1024 * 1024);

        // Enable CORS
        app.registerPreSendingAdvice([](const drogon::HttpRequestPtr& /* req */,
                                         const drogon::HttpResponsePtr& resp) {
            resp->addHeader("Access-Control-Allow-Origin", "*");
            resp->addHeader("Access-Control-Allow-Methods", "GET, POST, PUT, DELETE, OPTIONS");
            resp->addHeader("Access-Control-Allow-Headers", "Content-Type, Authorization");
        });

        // Answer CORS preflight requests on every path
        app.registerPreRoutingAdvice([](const drogon::HttpRequestPtr& req,
                                        drogon::AdviceCallback&& callback,
                                        drogon::AdviceChainCallback&& next) {
            if (req->method() == drogon::Options) {
                auto resp = drogon::HttpResponse::newHttpResponse();
                resp->setStatusCode(drogon::k204NoContent);
                callback(resp);
                return;
            }
            next();
        });

        registerRoutes(app, container);

        spdlog::info("Server starting on http://{}:{}", config.address, config.serverPort);
        spdlog::info("Press Ctrl+C to stop the server");

        app.run();

    } catch (const std::exception& e) {
        spdlog::error("Application error: {}", e.what());
        common::Logger::flush();
        return 1;
    }

    spdlog::info("Server stopped");
    common::Logger::flush();
    return 0;
}
