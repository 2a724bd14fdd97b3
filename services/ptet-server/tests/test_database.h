/**
 * @file test_database.h
 * @brief In-memory database fixture shared by the server tests
 */

#pragma once

#include <gtest/gtest.h>
#include <memory>
#include "schema_migrator.h"
#include "sqlite_query_executor.h"
#include "../src/infrastructure/migrations.h"
#include "../src/repositories/ride_repository.h"
#include "../src/repositories/ride_tag_link_repository.h"
#include "../src/repositories/tag_option_repository.h"
#include "../src/repositories/tag_repository.h"
#include "../src/repositories/user_repository.h"
#include "ptet/utils/time_utils.h"

/**
 * @brief Migrated sqlite::memory: database with all repositories and one user
 */
class DatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        executor = std::make_unique<common::SqliteQueryExecutor>(
            common::SqliteUri::parse("sqlite::memory:"));
        common::SchemaMigrator migrator(executor.get(), infrastructure::ptetMigrations());
        migrator.migrate();

        users = std::make_unique<repositories::UserRepository>(executor.get());
        rides = std::make_unique<repositories::RideRepository>(executor.get());
        tags = std::make_unique<repositories::TagRepository>(executor.get());
        options = std::make_unique<repositories::TagOptionRepository>(executor.get());
        links = std::make_unique<repositories::RideTagLinkRepository>(executor.get());

        userId = users->findOrCreate("issuer@example.tld", "alice").id;
        otherUserId = users->findOrCreate("issuer@example.tld", "mallory").id;
    }

    domain::models::Ride makeRide(const std::string& from = "Central",
                                  const std::string& to = "Airport") {
        domain::models::Ride ride;
        ride.journeyDeparture = *ptet::utils::parseRfc3339("2025-03-24T08:15:00Z");
        ride.locationFrom = from;
        ride.locationTo = to;
        return ride;
    }

    domain::models::Tag makeTag(domain::models::TagType type, const std::string& key) {
        domain::models::Tag tag;
        tag.tagType = type;
        tag.tagKey = key;
        return tag;
    }

    domain::models::TagOption makeOption(uint32_t order, const std::string& value) {
        domain::models::TagOption option;
        option.order = order;
        option.value = value;
        return option;
    }

    domain::models::RideTagLink makeLink(domain::models::RideTagValue value, uint32_t order = 0) {
        domain::models::RideTagLink link;
        link.order = order;
        link.value = std::move(value);
        return link;
    }

    std::unique_ptr<common::SqliteQueryExecutor> executor;
    std::unique_ptr<repositories::UserRepository> users;
    std::unique_ptr<repositories::RideRepository> rides;
    std::unique_ptr<repositories::TagRepository> tags;
    std::unique_ptr<repositories::TagOptionRepository> options;
    std::unique_ptr<repositories::RideTagLinkRepository> links;
    uint32_t userId = 0;
    uint32_t otherUserId = 0;
};
