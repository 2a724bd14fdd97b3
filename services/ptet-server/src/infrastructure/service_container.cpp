/**
 * @file service_container.cpp
 * @brief ServiceContainer implementation, dependency initialization in strict order
 *
 * @date 2026-03-25
 */

#include "service_container.h"
#include "app_config.h"
#include "migrations.h"

// Infrastructure (shared libraries, headers exposed via CMake PUBLIC includes)
#include "sqlite_query_executor.h"
#include "schema_migrator.h"
#include "ptet/keys/key_cache.h"

// Repositories
#include "../repositories/user_repository.h"
#include "../repositories/ride_repository.h"
#include "../repositories/tag_repository.h"
#include "../repositories/tag_option_repository.h"
#include "../repositories/ride_tag_link_repository.h"

// Auth and services
#include "../auth/request_authenticator.h"
#include "../services/ride_service.h"
#include "../services/ride_tag_service.h"
#include "../services/tag_service.h"
#include "../services/user_service.h"

// Handlers
#include "../handlers/user_handler.h"
#include "../handlers/ride_handler.h"
#include "../handlers/ride_tag_handler.h"
#include "../handlers/tag_handler.h"
#include "../handlers/tag_option_handler.h"
#include "../handlers/openapi_handler.h"

#include <spdlog/spdlog.h>

namespace infrastructure {

struct ServiceContainer::Impl {
    std::unique_ptr<common::SqliteQueryExecutor> queryExecutor;
    std::unique_ptr<ptet::keys::KeyCache> keyCache;

    // Repositories
    std::shared_ptr<repositories::UserRepository> userRepository;
    std::shared_ptr<repositories::RideRepository> rideRepository;
    std::shared_ptr<repositories::TagRepository> tagRepository;
    std::shared_ptr<repositories::TagOptionRepository> tagOptionRepository;
    std::shared_ptr<repositories::RideTagLinkRepository> rideTagLinkRepository;

    // Auth and services
    std::shared_ptr<auth::RequestAuthenticator> authenticator;
    std::shared_ptr<services::UserService> userService;
    std::shared_ptr<services::RideService> rideService;
    std::shared_ptr<services::TagService> tagService;
    std::shared_ptr<services::RideTagService> rideTagService;

    // Handlers
    std::shared_ptr<handlers::UserHandler> userHandler;
    std::shared_ptr<handlers::RideHandler> rideHandler;
    std::shared_ptr<handlers::RideTagHandler> rideTagHandler;
    std::shared_ptr<handlers::TagHandler> tagHandler;
    std::shared_ptr<handlers::TagOptionHandler> tagOptionHandler;
    std::shared_ptr<handlers::OpenApiHandler> openApiHandler;
};

ServiceContainer::ServiceContainer() : impl_(std::make_unique<Impl>()) {}

ServiceContainer::~ServiceContainer() {
    shutdown();
}

void ServiceContainer::shutdown() {
    if (!impl_) return;

    // Release in reverse order
    impl_->openApiHandler.reset();
    impl_->tagOptionHandler.reset();
    impl_->tagHandler.reset();
    impl_->rideTagHandler.reset();
    impl_->rideHandler.reset();
    impl_->userHandler.reset();

    impl_->rideTagService.reset();
    impl_->tagService.reset();
    impl_->rideService.reset();
    impl_->userService.reset();
    impl_->authenticator.reset();

    impl_->rideTagLinkRepository.reset();
    impl_->tagOptionRepository.reset();
    impl_->tagRepository.reset();
    impl_->rideRepository.reset();
    impl_->userRepository.reset();

    impl_->keyCache.reset();
    if (impl_->queryExecutor) {
        impl_->queryExecutor.reset();
        spdlog::info("Database connection closed");
    }

    spdlog::info("ServiceContainer resources released");
}

bool ServiceContainer::initialize(const AppConfig& config) {
    spdlog::info("ServiceContainer initializing...");

    // --- Phase 1: Database + migrations ---
    try {
        common::SqliteUri uri = common::SqliteUri::parse(config.databaseUri);
        impl_->queryExecutor = std::make_unique<common::SqliteQueryExecutor>(uri);
        spdlog::info("Database opened: {}", impl_->queryExecutor->path());

        common::SchemaMigrator migrator(impl_->queryExecutor.get(), ptetMigrations());
        if (uri.mode == common::SqliteUri::Mode::ReadOnly) {
            spdlog::warn("Database opened read-only, schema migrations skipped");
        } else {
            migrator.migrate();
        }
    } catch (const std::exception& e) {
        spdlog::critical("Failed to initialize database: {}", e.what());
        return false;
    }

    // --- Phase 2: Key cache ---
    try {
        impl_->keyCache = std::make_unique<ptet::keys::KeyCache>(ptet::keys::KeyStore(config.keysDir));
        auto keyIds = impl_->keyCache->keyIdList();
        if (keyIds.empty()) {
            spdlog::warn("Key directory {} contains no keys, every token will be rejected", config.keysDir);
        } else {
            spdlog::info("Key cache initialized ({} key(s), default: {})", keyIds.size(),
                         impl_->keyCache->defaultKeyId().value_or("<none>"));
        }
    } catch (const std::exception& e) {
        spdlog::critical("Failed to open key directory {}: {}", config.keysDir, e.what());
        return false;
    }

    // --- Phase 3: Repositories ---
    common::IQueryExecutor* executor = impl_->queryExecutor.get();
    impl_->userRepository = std::make_shared<repositories::UserRepository>(executor);
    impl_->rideRepository = std::make_shared<repositories::RideRepository>(executor);
    impl_->tagRepository = std::make_shared<repositories::TagRepository>(executor);
    impl_->tagOptionRepository = std::make_shared<repositories::TagOptionRepository>(executor);
    impl_->rideTagLinkRepository = std::make_shared<repositories::RideTagLinkRepository>(executor);
    spdlog::info("Repositories initialized (User, Ride, Tag, TagOption, RideTagLink)");

    // --- Phase 4: Authenticator + services ---
    auth::AuthSettings authSettings;
    authSettings.audience = config.serverBaseUri;
    authSettings.issuer = config.expectJwtIssuer;
    authSettings.issuedAfter = config.jwtIssuedAfter;
    authSettings.maxExpiration = std::chrono::seconds(config.jwtMaxExpiration);

    impl_->authenticator = std::make_shared<auth::RequestAuthenticator>(
        impl_->keyCache.get(), impl_->userRepository.get(), authSettings);
    impl_->userService = std::make_shared<services::UserService>(impl_->userRepository.get());
    impl_->rideService = std::make_shared<services::RideService>(impl_->rideRepository.get());
    impl_->tagService = std::make_shared<services::TagService>(
        impl_->tagRepository.get(), impl_->tagOptionRepository.get());
    impl_->rideTagService = std::make_shared<services::RideTagService>(
        impl_->rideRepository.get(), impl_->tagRepository.get(), impl_->rideTagLinkRepository.get());

    // --- Phase 5: Handlers ---
    auto* authenticator = impl_->authenticator.get();
    impl_->userHandler = std::make_shared<handlers::UserHandler>(impl_->userService.get(), authenticator);
    impl_->rideHandler = std::make_shared<handlers::RideHandler>(impl_->rideService.get(), authenticator);
    impl_->rideTagHandler = std::make_shared<handlers::RideTagHandler>(impl_->rideTagService.get(), authenticator);
    impl_->tagHandler = std::make_shared<handlers::TagHandler>(impl_->tagService.get(), authenticator);
    impl_->tagOptionHandler = std::make_shared<handlers::TagOptionHandler>(impl_->tagService.get(), authenticator);
    impl_->openApiHandler = std::make_shared<handlers::OpenApiHandler>(PTET_VERSION);

    spdlog::info("ServiceContainer initialized");
    return true;
}

common::IQueryExecutor* ServiceContainer::queryExecutor() const { return impl_->queryExecutor.get(); }
ptet::keys::KeyCache* ServiceContainer::keyCache() const { return impl_->keyCache.get(); }
auth::RequestAuthenticator* ServiceContainer::authenticator() const { return impl_->authenticator.get(); }

repositories::UserRepository* ServiceContainer::userRepository() const { return impl_->userRepository.get(); }
repositories::RideRepository* ServiceContainer::rideRepository() const { return impl_->rideRepository.get(); }
repositories::TagRepository* ServiceContainer::tagRepository() const { return impl_->tagRepository.get(); }
repositories::TagOptionRepository* ServiceContainer::tagOptionRepository() const { return impl_->tagOptionRepository.get(); }
repositories::RideTagLinkRepository* ServiceContainer::rideTagLinkRepository() const { return impl_->rideTagLinkRepository.get(); }

services::UserService* ServiceContainer::userService() const { return impl_->userService.get(); }
services::RideService* ServiceContainer::rideService() const { return impl_->rideService.get(); }
services::TagService* ServiceContainer::tagService() const { return impl_->tagService.get(); }
services::RideTagService* ServiceContainer::rideTagService() const { return impl_->rideTagService.get(); }

handlers::UserHandler* ServiceContainer::userHandler() const { return impl_->userHandler.get(); }
handlers::RideHandler* ServiceContainer::rideHandler() const { return impl_->rideHandler.get(); }
handlers::RideTagHandler* ServiceContainer::rideTagHandler() const { return impl_->rideTagHandler.get(); }
handlers::TagHandler* ServiceContainer::tagHandler() const { return impl_->tagHandler.get(); }
handlers::TagOptionHandler* ServiceContainer::tagOptionHandler() const { return impl_->tagOptionHandler.get(); }
handlers::OpenApiHandler* ServiceContainer::openApiHandler() const { return impl_->openApiHandler.get(); }

} // namespace infrastructure
