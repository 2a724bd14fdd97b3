/**
 * @file test_repositories.cpp
 * @brief Repository tests against a migrated in-memory database
 */

#include "test_database.h"
#include "exceptions.h"
#include "shared/util/UuidUtil.hpp"

using namespace domain::models;

// --- UserRepository ---

TEST_F(DatabaseTest, User_FindOrCreateIsIdempotent) {
    auto again = users->findOrCreate("issuer@example.tld", "alice");
    EXPECT_EQ(again.id, userId);
    EXPECT_EQ(again.jwtSubject, "alice");
    EXPECT_FALSE(again.name.has_value());

    auto otherIssuer = users->findOrCreate("other@example.tld", "alice");
    EXPECT_NE(otherIssuer.id, userId);
}

TEST_F(DatabaseTest, User_UpdateName) {
    users->updateName(userId, std::string("Alice"));
    EXPECT_EQ(users->findById(userId)->name, std::optional<std::string>("Alice"));

    users->updateName(userId, std::nullopt);
    EXPECT_FALSE(users->findById(userId)->name.has_value());
}

TEST_F(DatabaseTest, User_Missing) {
    EXPECT_FALSE(users->findById(9999).has_value());
    EXPECT_THROW(users->updateName(9999, std::string("x")), common::NotFoundException);
}

// --- RideRepository ---

TEST_F(DatabaseTest, Ride_InsertAndFind) {
    Ride input = makeRide();
    input.journeyArrival = *ptet::utils::parseRfc3339("2025-03-24T08:45:00Z");
    input.remarks = "window seat";
    input.isTemplate = true;

    Ride stored = rides->insert(userId, input);
    EXPECT_GT(stored.id, 0u);

    Ride found = rides->findById(stored.id);
    EXPECT_EQ(found.locationFrom, "Central");
    EXPECT_EQ(found.locationTo, "Airport");
    EXPECT_EQ(ptet::utils::formatRfc3339(found.journeyDeparture), "2025-03-24T08:15:00Z");
    ASSERT_TRUE(found.journeyArrival.has_value());
    EXPECT_EQ(ptet::utils::formatRfc3339(*found.journeyArrival), "2025-03-24T08:45:00Z");
    EXPECT_EQ(found.remarks, std::optional<std::string>("window seat"));
    EXPECT_TRUE(found.isTemplate);
    EXPECT_TRUE(found.tags.empty());
}

TEST_F(DatabaseTest, Ride_ListIsPerUserAndPaged) {
    for (int i = 0; i < 5; ++i) {
        rides->insert(userId, makeRide("Stop " + std::to_string(i)));
    }
    rides->insert(otherUserId, makeRide("Elsewhere"));

    EXPECT_EQ(rides->countAll(userId), 5);
    EXPECT_EQ(rides->countAll(otherUserId), 1);
    EXPECT_EQ(rides->findAll(userId).size(), 5u);

    auto page = rides->findAll(userId, 2, 2);
    ASSERT_EQ(page.size(), 2u);
    EXPECT_EQ(page[0].locationFrom, "Stop 2");
    EXPECT_EQ(page[1].locationFrom, "Stop 3");

    EXPECT_TRUE(rides->findAll(userId, 2, 10).empty());
}

TEST_F(DatabaseTest, Ride_UpdateAndSoftDelete) {
    Ride stored = rides->insert(userId, makeRide());
    Ride changed = makeRide("Harbour", "Museum");
    rides->update(stored.id, changed);
    EXPECT_EQ(rides->findById(stored.id).locationFrom, "Harbour");

    rides->remove(stored.id);
    EXPECT_THROW(rides->findById(stored.id), common::NotFoundException);
    EXPECT_THROW(rides->update(stored.id, changed), common::NotFoundException);
    EXPECT_THROW(rides->remove(stored.id), common::NotFoundException);
    EXPECT_EQ(rides->countAll(userId), 0);
}

TEST_F(DatabaseTest, Ride_RequireOwner) {
    Ride stored = rides->insert(userId, makeRide());
    EXPECT_NO_THROW(rides->requireOwner(stored.id, userId));
    EXPECT_THROW(rides->requireOwner(stored.id, otherUserId), common::NotFoundException);
    EXPECT_THROW(rides->requireOwner(9999, userId), common::NotFoundException);
}

TEST_F(DatabaseTest, Ride_TagsExcludeDeletedLinks) {
    Ride ride = rides->insert(userId, makeRide());
    Tag price = tags->insert(userId, makeTag(TagType::Float, "price"));
    Tag line = tags->insert(userId, makeTag(TagType::String, "line"));

    links->insert(ride.id, price.id, makeLink(RideTagValue::floating(2.9), 1));
    auto lineLink = links->insert(ride.id, line.id, makeLink(RideTagValue::string("S1"), 0));

    Ride found = rides->findById(ride.id);
    ASSERT_EQ(found.tags.size(), 2u);
    EXPECT_EQ(found.tags[0].tagId, line.id);
    EXPECT_EQ(found.tags[1].tagId, price.id);

    links->remove(lineLink.id);
    found = rides->findById(ride.id);
    ASSERT_EQ(found.tags.size(), 1u);
    EXPECT_DOUBLE_EQ(found.tags[0].value.asFloat(), 2.9);
}

// --- TagRepository ---

TEST_F(DatabaseTest, Tag_InsertAssignsUuid) {
    Tag input = makeTag(TagType::Integer, "zones");
    input.tagName = "Zones";
    input.unit = "zones";

    Tag stored = tags->insert(userId, input);
    EXPECT_GT(stored.id, 0u);
    EXPECT_TRUE(shared::util::UuidUtil::isValid(stored.uuid));
    EXPECT_FALSE(stored.options.has_value());

    Tag found = tags->findById(stored.id);
    EXPECT_EQ(found.tagType, TagType::Integer);
    EXPECT_EQ(found.tagKey, "zones");
    EXPECT_EQ(found.displayName(), "Zones");
    EXPECT_EQ(found.uuid, stored.uuid);
    EXPECT_FALSE(found.options.has_value());
}

TEST_F(DatabaseTest, Tag_EnumCarriesOptions) {
    Tag stored = tags->insert(userId, makeTag(TagType::Enum, "class"));
    ASSERT_TRUE(stored.options.has_value());
    EXPECT_TRUE(stored.options->empty());

    options->insert(stored.id, makeOption(2, "second"));
    options->insert(stored.id, makeOption(1, "first"));

    Tag found = tags->findById(stored.id);
    ASSERT_TRUE(found.options.has_value());
    ASSERT_EQ(found.options->size(), 2u);
    EXPECT_EQ((*found.options)[0].value, "first");
    EXPECT_EQ((*found.options)[1].value, "second");

    auto all = tags->findAll(userId);
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].options->size(), 2u);
}

TEST_F(DatabaseTest, Tag_UpdateRemoveAndOwnership) {
    Tag stored = tags->insert(userId, makeTag(TagType::String, "operator"));
    EXPECT_THROW(tags->requireOwner(stored.id, otherUserId), common::NotFoundException);

    Tag changed = makeTag(TagType::String, "operator");
    changed.remarks = "bus company";
    tags->update(stored.id, changed);
    EXPECT_EQ(tags->findById(stored.id).remarks, std::optional<std::string>("bus company"));

    tags->remove(stored.id);
    EXPECT_THROW(tags->findById(stored.id), common::NotFoundException);
    EXPECT_THROW(tags->requireOwner(stored.id, userId), common::NotFoundException);
    EXPECT_EQ(tags->countAll(userId), 0);
}

TEST_F(DatabaseTest, Tag_InvalidStoredTypeIsInternalError) {
    Tag stored = tags->insert(userId, makeTag(TagType::String, "broken"));
    executor->executeCommand("UPDATE tag_descriptor SET tag_type = 'colour' WHERE id = ?",
                             {static_cast<int64_t>(stored.id)});
    EXPECT_THROW(tags->findById(stored.id), common::InternalException);
}

// --- TagOptionRepository ---

TEST_F(DatabaseTest, Option_CrudAndOwnership) {
    Tag tag = tags->insert(userId, makeTag(TagType::Enum, "class"));
    TagOption input = makeOption(0, "1st");
    input.name = "First class";

    TagOption stored = options->insert(tag.id, input);
    EXPECT_EQ(stored.tagId, tag.id);
    EXPECT_EQ(stored.uuid.size(), 36u);
    EXPECT_EQ(options->findById(stored.id).displayName(), "First class");
    EXPECT_EQ(options->countAll(tag.id), 1);

    EXPECT_NO_THROW(options->requireOwner(stored.id, userId));
    EXPECT_THROW(options->requireOwner(stored.id, otherUserId), common::NotFoundException);

    options->update(stored.id, makeOption(3, "first"));
    TagOption updated = options->findById(stored.id);
    EXPECT_EQ(updated.order, 3u);
    EXPECT_EQ(updated.displayName(), "first");

    options->remove(stored.id);
    EXPECT_THROW(options->findById(stored.id), common::NotFoundException);
    EXPECT_EQ(options->countAll(tag.id), 0);
}

TEST_F(DatabaseTest, Option_DeletedTagHidesOptions) {
    Tag tag = tags->insert(userId, makeTag(TagType::Enum, "class"));
    TagOption stored = options->insert(tag.id, makeOption(0, "1st"));
    tags->remove(tag.id);
    EXPECT_THROW(options->requireOwner(stored.id, userId), common::NotFoundException);
}

// --- RideTagLinkRepository ---

TEST_F(DatabaseTest, Link_StoresEveryValueType) {
    Ride ride = rides->insert(userId, makeRide());
    Tag intTag = tags->insert(userId, makeTag(TagType::Integer, "zones"));
    Tag floatTag = tags->insert(userId, makeTag(TagType::Float, "price"));
    Tag stringTag = tags->insert(userId, makeTag(TagType::String, "line"));
    Tag timeTag = tags->insert(userId, makeTag(TagType::DateTime, "booked"));
    Tag enumTag = tags->insert(userId, makeTag(TagType::Enum, "class"));
    TagOption option = options->insert(enumTag.id, makeOption(0, "2nd"));

    auto booked = *ptet::utils::parseRfc3339("2025-03-20T10:00:00Z");
    uint32_t intId = links->insert(ride.id, intTag.id, makeLink(RideTagValue::integer(-3))).id;
    uint32_t floatId = links->insert(ride.id, floatTag.id, makeLink(RideTagValue::floating(0.0))).id;
    uint32_t stringId = links->insert(ride.id, stringTag.id, makeLink(RideTagValue::string(""))).id;
    uint32_t timeId = links->insert(ride.id, timeTag.id, makeLink(RideTagValue::dateTime(booked))).id;
    uint32_t enumId = links->insert(ride.id, enumTag.id, makeLink(RideTagValue::enumOption(option.id))).id;

    EXPECT_EQ(links->findById(intId).value.asInteger(), -3);
    EXPECT_EQ(links->findById(floatId).value.type(), RideTagValue::Type::Float);
    EXPECT_EQ(links->findById(stringId).value.asString(), "");
    EXPECT_EQ(links->findById(timeId).value.asDateTime(), booked);
    EXPECT_EQ(links->findById(enumId).value.asEnumOption(), option.id);
    EXPECT_EQ(links->countAll(ride.id), 5);
}

TEST_F(DatabaseTest, Link_DateTimeKeepsFraction) {
    Ride ride = rides->insert(userId, makeRide());
    Tag timeTag = tags->insert(userId, makeTag(TagType::DateTime, "booked"));

    auto booked = *ptet::utils::parseRfc3339("2025-03-20T10:00:00.123456Z");
    uint32_t timeId = links->insert(ride.id, timeTag.id, makeLink(RideTagValue::dateTime(booked))).id;

    auto stored = links->findById(timeId).value.asDateTime();
    EXPECT_EQ(stored, booked);
    EXPECT_EQ(ptet::utils::formatRfc3339(stored), "2025-03-20T10:00:00.123456Z");
}

TEST_F(DatabaseTest, Link_UpdateChangesValueType) {
    Ride ride = rides->insert(userId, makeRide());
    Tag tag = tags->insert(userId, makeTag(TagType::String, "line"));
    auto stored = links->insert(ride.id, tag.id, makeLink(RideTagValue::string("S1")));

    auto changed = makeLink(RideTagValue::integer(7), 4);
    changed.remarks = "changed";
    links->update(stored.id, changed);

    auto found = links->findById(stored.id);
    EXPECT_EQ(found.value.type(), RideTagValue::Type::Integer);
    EXPECT_EQ(found.value.asInteger(), 7);
    EXPECT_EQ(found.order, 4u);
    EXPECT_EQ(found.remarks, std::optional<std::string>("changed"));
}

TEST_F(DatabaseTest, Link_FindByTagIdAndOwnership) {
    Ride ride = rides->insert(userId, makeRide());
    Tag tag = tags->insert(userId, makeTag(TagType::Integer, "zones"));
    EXPECT_FALSE(links->findByTagId(ride.id, tag.id).has_value());

    auto stored = links->insert(ride.id, tag.id, makeLink(RideTagValue::integer(2)));
    ASSERT_TRUE(links->findByTagId(ride.id, tag.id).has_value());
    EXPECT_EQ(links->findByTagId(ride.id, tag.id)->id, stored.id);

    EXPECT_NO_THROW(links->requireOwner(stored.id, userId));
    EXPECT_THROW(links->requireOwner(stored.id, otherUserId), common::NotFoundException);

    rides->remove(ride.id);
    EXPECT_THROW(links->requireOwner(stored.id, userId), common::NotFoundException);
}

TEST_F(DatabaseTest, Link_RemovedIsGone) {
    Ride ride = rides->insert(userId, makeRide());
    Tag tag = tags->insert(userId, makeTag(TagType::Integer, "zones"));
    auto stored = links->insert(ride.id, tag.id, makeLink(RideTagValue::integer(2)));

    links->remove(stored.id);
    EXPECT_THROW(links->findById(stored.id), common::NotFoundException);
    EXPECT_THROW(links->remove(stored.id), common::NotFoundException);
    EXPECT_FALSE(links->findByTagId(ride.id, tag.id).has_value());
}

TEST_F(DatabaseTest, Link_RowWithoutValueIsInternalError) {
    Ride ride = rides->insert(userId, makeRide());
    Tag tag = tags->insert(userId, makeTag(TagType::Integer, "zones"));
    auto stored = links->insert(ride.id, tag.id, makeLink(RideTagValue::integer(2)));
    executor->executeCommand("UPDATE ride_tag SET value_integer = NULL WHERE id = ?",
                             {static_cast<int64_t>(stored.id)});

    try {
        links->findById(stored.id);
        FAIL() << "Expected InternalException";
    } catch (const common::InternalException& e) {
        EXPECT_EQ(std::string(e.what()), "Cannot infer value type from " + std::to_string(stored.id));
    }
}

TEST_F(DatabaseTest, Repository_NullExecutor) {
    EXPECT_THROW(repositories::UserRepository(nullptr), std::invalid_argument);
    EXPECT_THROW(repositories::RideRepository(nullptr), std::invalid_argument);
    EXPECT_THROW(repositories::TagRepository(nullptr), std::invalid_argument);
    EXPECT_THROW(repositories::TagOptionRepository(nullptr), std::invalid_argument);
    EXPECT_THROW(repositories::RideTagLinkRepository(nullptr), std::invalid_argument);
}
