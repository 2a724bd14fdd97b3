#pragma once

/**
 * @file service_container.h
 * @brief Centralized service container for dependency management
 *
 * Owns the database connection, key cache, repositories, services and
 * handlers. Provides non-owning pointer accessors for dependency injection.
 *
 * @date 2026-03-25
 */

#include <memory>

struct AppConfig;

// Forward declarations - Infrastructure
namespace common {
    class IQueryExecutor;
}

namespace ptet::keys {
    class KeyCache;
}

namespace auth {
    class RequestAuthenticator;
}

// Forward declarations - Repositories
namespace repositories {
    class UserRepository;
    class RideRepository;
    class TagRepository;
    class TagOptionRepository;
    class RideTagLinkRepository;
}

// Forward declarations - Services
namespace services {
    class UserService;
    class RideService;
    class TagService;
    class RideTagService;
}

// Forward declarations - Handlers
namespace handlers {
    class UserHandler;
    class RideHandler;
    class RideTagHandler;
    class TagHandler;
    class TagOptionHandler;
    class OpenApiHandler;
}

namespace infrastructure {

/**
 * @brief Centralized service container managing all application dependencies
 *
 * Initialization order:
 * 1. SQLite connection + schema migrations
 * 2. Key cache (verification keys)
 * 3. Repositories
 * 4. Authenticator and services
 * 5. Handlers
 */
class ServiceContainer {
public:
    ServiceContainer();
    ~ServiceContainer();

    // Non-copyable, non-movable
    ServiceContainer(const ServiceContainer&) = delete;
    ServiceContainer& operator=(const ServiceContainer&) = delete;

    /**
     * @brief Initialize all components in dependency order
     * @param config Application configuration
     * @return true on success, false on failure (details logged)
     */
    bool initialize(const AppConfig& config);

    /**
     * @brief Release all resources (called automatically by destructor)
     */
    void shutdown();

    common::IQueryExecutor* queryExecutor() const;
    ptet::keys::KeyCache* keyCache() const;
    auth::RequestAuthenticator* authenticator() const;

    // --- Repository Accessors ---
    repositories::UserRepository* userRepository() const;
    repositories::RideRepository* rideRepository() const;
    repositories::TagRepository* tagRepository() const;
    repositories::TagOptionRepository* tagOptionRepository() const;
    repositories::RideTagLinkRepository* rideTagLinkRepository() const;

    // --- Service Accessors ---
    services::UserService* userService() const;
    services::RideService* rideService() const;
    services::TagService* tagService() const;
    services::RideTagService* rideTagService() const;

    // --- Handler Accessors ---
    handlers::UserHandler* userHandler() const;
    handlers::RideHandler* rideHandler() const;
    handlers::RideTagHandler* rideTagHandler() const;
    handlers::TagHandler* tagHandler() const;
    handlers::TagOptionHandler* tagOptionHandler() const;
    handlers::OpenApiHandler* openApiHandler() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace infrastructure
