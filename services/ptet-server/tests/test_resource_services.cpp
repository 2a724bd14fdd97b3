/**
 * @file test_resource_services.cpp
 * @brief Tests for ride, tag, option and user services (owner checks first)
 */

#include "test_database.h"
#include "exceptions.h"
#include "../src/common/api_error.h"
#include "../src/common/path_id.h"
#include "../src/services/ride_service.h"
#include "../src/services/tag_service.h"
#include "../src/services/user_service.h"

using namespace domain::models;

class ResourceServicesTest : public DatabaseTest {
protected:
    void SetUp() override {
        DatabaseTest::SetUp();
        rideService = std::make_unique<services::RideService>(rides.get());
        tagService = std::make_unique<services::TagService>(tags.get(), options.get());
        userService = std::make_unique<services::UserService>(users.get());

        rideId = rideService->create(userId, makeRide()).id;
        tagId = tagService->create(userId, makeTag(TagType::Enum, "class")).id;
        optionId = tagService->createOption(userId, tagId, makeOption(0, "2nd")).id;
    }

    std::unique_ptr<services::RideService> rideService;
    std::unique_ptr<services::TagService> tagService;
    std::unique_ptr<services::UserService> userService;
    uint32_t rideId = 0;
    uint32_t tagId = 0;
    uint32_t optionId = 0;
};

// --- Construction ---

TEST_F(ResourceServicesTest, Constructor_NullRepository) {
    EXPECT_THROW(services::RideService(nullptr), std::invalid_argument);
    EXPECT_THROW(services::TagService(tags.get(), nullptr), std::invalid_argument);
    EXPECT_THROW(services::UserService(nullptr), std::invalid_argument);
}

// --- Path ids ---

TEST_F(ResourceServicesTest, PathId) {
    EXPECT_EQ(common::parsePathId("42"), 42u);
    EXPECT_EQ(common::parsePathId("4294967295"), 4294967295u);

    for (const char* segment : {"", "abc", "-1", "1.5", "4294967296", " 7"}) {
        try {
            common::parsePathId(segment);
            FAIL() << "Expected ApiError for '" << segment << "'";
        } catch (const common::ApiError& e) {
            EXPECT_EQ(e.code(), 404);
        }
    }
}

// --- Rides ---

TEST_F(ResourceServicesTest, Ride_OwnerAccess) {
    auto ride = rideService->get(userId, rideId);
    EXPECT_EQ(ride.locationFrom, "Central");

    rideService->update(userId, rideId, makeRide("Harbour", "Airport"));
    EXPECT_EQ(rideService->get(userId, rideId).locationFrom, "Harbour");

    rideService->remove(userId, rideId);
    EXPECT_THROW(rideService->get(userId, rideId), common::NotFoundException);
}

TEST_F(ResourceServicesTest, Ride_ForeignUser) {
    EXPECT_THROW(rideService->get(otherUserId, rideId), common::NotFoundException);
    EXPECT_THROW(rideService->update(otherUserId, rideId, makeRide("Harbour")), common::NotFoundException);
    EXPECT_THROW(rideService->remove(otherUserId, rideId), common::NotFoundException);

    // Unchanged for the owner
    EXPECT_EQ(rideService->get(userId, rideId).locationFrom, "Central");
    EXPECT_EQ(rideService->list(otherUserId).totalItems, 0);
}

TEST_F(ResourceServicesTest, Ride_DeletedOrMissing) {
    rideService->remove(userId, rideId);
    EXPECT_THROW(rideService->update(userId, rideId, makeRide()), common::NotFoundException);
    EXPECT_THROW(rideService->remove(userId, rideId), common::NotFoundException);
    EXPECT_THROW(rideService->get(userId, 9999), common::NotFoundException);
}

TEST_F(ResourceServicesTest, Ride_ListPaged) {
    rideService->create(userId, makeRide("A", "B"));
    rideService->create(userId, makeRide("C", "D"));

    auto all = rideService->list(userId);
    EXPECT_EQ(all.totalItems, 3);
    EXPECT_EQ(all.items.size(), 3u);

    auto page = rideService->list(userId, common::PageRequest{1, 2});
    EXPECT_EQ(page.totalItems, 3);
    ASSERT_EQ(page.items.size(), 1u);
}

// --- Tags ---

TEST_F(ResourceServicesTest, Tag_ForeignUser) {
    EXPECT_THROW(tagService->get(otherUserId, tagId), common::NotFoundException);
    EXPECT_THROW(tagService->update(otherUserId, tagId, makeTag(TagType::Enum, "stolen")),
                 common::NotFoundException);
    EXPECT_THROW(tagService->remove(otherUserId, tagId), common::NotFoundException);

    EXPECT_EQ(tagService->get(userId, tagId).tagKey, "class");
}

TEST_F(ResourceServicesTest, Tag_GetIncludesOptions) {
    auto tag = tagService->get(userId, tagId);
    ASSERT_TRUE(tag.options.has_value());
    ASSERT_EQ(tag.options->size(), 1u);
    EXPECT_EQ(tag.options->front().id, optionId);
}

// --- Options ---

TEST_F(ResourceServicesTest, Option_ForeignUser) {
    EXPECT_THROW(tagService->listOptions(otherUserId, tagId), common::NotFoundException);
    EXPECT_THROW(tagService->createOption(otherUserId, tagId, makeOption(1, "1st")),
                 common::NotFoundException);
    EXPECT_THROW(tagService->getOption(otherUserId, optionId), common::NotFoundException);
    EXPECT_THROW(tagService->updateOption(otherUserId, optionId, makeOption(1, "1st")),
                 common::NotFoundException);
    EXPECT_THROW(tagService->removeOption(otherUserId, optionId), common::NotFoundException);

    EXPECT_EQ(tagService->listOptions(userId, tagId).totalItems, 1);
}

TEST_F(ResourceServicesTest, Option_DeletedTag) {
    tagService->remove(userId, tagId);

    EXPECT_THROW(tagService->listOptions(userId, tagId), common::NotFoundException);
    EXPECT_THROW(tagService->createOption(userId, tagId, makeOption(1, "1st")),
                 common::NotFoundException);
    EXPECT_THROW(tagService->getOption(userId, optionId), common::NotFoundException);
    EXPECT_THROW(tagService->removeOption(userId, optionId), common::NotFoundException);
}

TEST_F(ResourceServicesTest, Option_UpdateAndRemove) {
    tagService->updateOption(userId, optionId, makeOption(3, "first"));
    auto option = tagService->getOption(userId, optionId);
    EXPECT_EQ(option.order, 3u);
    EXPECT_EQ(option.value, "first");
    EXPECT_EQ(option.tagId, tagId);

    tagService->removeOption(userId, optionId);
    EXPECT_THROW(tagService->getOption(userId, optionId), common::NotFoundException);
    EXPECT_EQ(tagService->listOptions(userId, tagId).totalItems, 0);
}

// --- User ---

TEST_F(ResourceServicesTest, User_CurrentAndRename) {
    auto user = userService->current(userId);
    EXPECT_EQ(user.jwtSubject, "alice");
    EXPECT_FALSE(user.name.has_value());

    userService->rename(userId, std::string("Alice"));
    EXPECT_EQ(userService->current(userId).name, std::optional<std::string>("Alice"));

    userService->rename(userId, std::nullopt);
    EXPECT_FALSE(userService->current(userId).name.has_value());

    // Other users are untouched
    EXPECT_FALSE(userService->current(otherUserId).name.has_value());
    EXPECT_THROW(userService->current(9999), common::NotFoundException);
}
