/** @file tag_repository.cpp
 *  @brief TagRepository implementation
 */

#include "tag_repository.h"
#include "tag_option_repository.h"
#include "repository_utils.h"
#include "shared/util/UuidUtil.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace repositories {

using domain::models::Tag;
using domain::models::TagType;

namespace {
const char* const kSelectColumns =
    "SELECT id, tag_type, tag_key, tag_name, uuid, unit, remarks FROM tag_descriptor ";
}

TagRepository::TagRepository(common::IQueryExecutor* executor)
    : executor_(executor)
{
    if (!executor_) {
        throw std::invalid_argument("TagRepository: executor cannot be nullptr");
    }
    spdlog::debug("[TagRepository] Initialized (DB type: {})", executor_->getDatabaseType());
}

TagRepository::~TagRepository() {}

std::vector<Tag> TagRepository::findAll(uint32_t userId, int64_t limit, int64_t offset) {
    std::vector<Tag> items;
    try {
        Json::Value result = executor_->executeQuery(
            std::string(kSelectColumns) +
            "WHERE user_id = ? AND deleted_at IS NULL ORDER BY id LIMIT ? OFFSET ?",
            {static_cast<int64_t>(userId), limit, offset});

        for (const auto& row : result) {
            items.push_back(jsonToModel(row));
            loadOptions(items.back());
        }
    } catch (const common::DatabaseException& e) {
        spdlog::error("[TagRepository] findAll failed: {}", e.what());
        throw;
    }
    return items;
}

int64_t TagRepository::countAll(uint32_t userId) {
    try {
        Json::Value result = executor_->executeScalar(
            "SELECT COUNT(*) FROM tag_descriptor WHERE user_id = ? AND deleted_at IS NULL",
            {static_cast<int64_t>(userId)});
        return common::db::scalarToInt64(result);
    } catch (const common::DatabaseException& e) {
        spdlog::error("[TagRepository] countAll failed: {}", e.what());
        throw;
    }
}

Tag TagRepository::findById(uint32_t id) {
    Json::Value result;
    try {
        result = executor_->executeQuery(
            std::string(kSelectColumns) + "WHERE id = ? AND deleted_at IS NULL",
            {static_cast<int64_t>(id)});
    } catch (const common::DatabaseException& e) {
        spdlog::error("[TagRepository] findById failed: {}", e.what());
        throw;
    }

    if (result.empty()) {
        throw common::NotFoundException();
    }

    Tag tag = jsonToModel(result[0]);
    try {
        loadOptions(tag);
    } catch (const common::DatabaseException& e) {
        spdlog::error("[TagRepository] Loading options of tag {} failed: {}", id, e.what());
        throw;
    }
    return tag;
}

void TagRepository::requireOwner(uint32_t tagId, uint32_t userId) {
    Json::Value result;
    try {
        result = executor_->executeScalar(
            "SELECT COUNT(*) FROM tag_descriptor WHERE id = ? AND user_id = ? AND deleted_at IS NULL",
            {static_cast<int64_t>(tagId), static_cast<int64_t>(userId)});
    } catch (const common::DatabaseException& e) {
        spdlog::error("[TagRepository] requireOwner failed: {}", e.what());
        throw;
    }

    if (common::db::scalarToInt64(result) == 0) {
        throw common::NotFoundException();
    }
}

Tag TagRepository::insert(uint32_t userId, const Tag& tag) {
    std::string now = nowText();
    std::string uuid = shared::util::UuidUtil::generate();

    Json::Value result;
    try {
        result = executor_->executeQuery(
            "INSERT INTO tag_descriptor (created_at, updated_at, user_id, tag_type, tag_key, "
            "                            tag_name, uuid, unit, remarks) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?) RETURNING id",
            {now, now, static_cast<int64_t>(userId), domain::models::tagTypeToString(tag.tagType),
             tag.tagKey, optionalText(tag.tagName), uuid, optionalText(tag.unit),
             optionalText(tag.remarks)});
    } catch (const common::DatabaseException& e) {
        spdlog::error("[TagRepository] Insert failed: {}", e.what());
        throw;
    }

    if (result.empty()) {
        throw common::InternalException("Insert into tag_descriptor returned no id");
    }

    Tag stored = tag;
    stored.id = getId(result[0], "id");
    stored.uuid = uuid;
    if (stored.tagType == TagType::Enum) {
        stored.options = std::vector<domain::models::TagOption>{};
    } else {
        stored.options.reset();
    }
    spdlog::info("[TagRepository] Inserted tag {} ({}) for user {}", stored.id, stored.tagKey, userId);
    return stored;
}

void TagRepository::update(uint32_t id, const Tag& tag) {
    int rowsAffected = 0;
    try {
        rowsAffected = executor_->executeCommand(
            "UPDATE tag_descriptor SET updated_at = ?, tag_type = ?, tag_key = ?, tag_name = ?, "
            "  unit = ?, remarks = ? "
            "WHERE id = ? AND deleted_at IS NULL",
            {nowText(), domain::models::tagTypeToString(tag.tagType), tag.tagKey,
             optionalText(tag.tagName), optionalText(tag.unit), optionalText(tag.remarks),
             static_cast<int64_t>(id)});
    } catch (const common::DatabaseException& e) {
        spdlog::error("[TagRepository] Update failed: {}", e.what());
        throw;
    }

    if (rowsAffected == 0) {
        throw common::NotFoundException();
    }
    spdlog::info("[TagRepository] Updated tag {}", id);
}

void TagRepository::remove(uint32_t id) {
    int rowsAffected = 0;
    try {
        rowsAffected = executor_->executeCommand(
            "UPDATE tag_descriptor SET deleted_at = ? WHERE id = ? AND deleted_at IS NULL",
            {nowText(), static_cast<int64_t>(id)});
    } catch (const common::DatabaseException& e) {
        spdlog::error("[TagRepository] Remove failed: {}", e.what());
        throw;
    }

    if (rowsAffected == 0) {
        throw common::NotFoundException();
    }
    spdlog::info("[TagRepository] Deleted tag {}", id);
}

Tag TagRepository::jsonToModel(const Json::Value& row) {
    Tag tag;
    tag.id = getId(row, "id");

    std::string type = common::db::getString(row, "tag_type");
    auto tagType = domain::models::tagTypeFromString(type);
    if (!tagType) {
        throw common::InternalException("Invalid tag type '" + type + "' stored for tag " +
                                        std::to_string(tag.id));
    }
    tag.tagType = *tagType;
    tag.tagKey = common::db::getString(row, "tag_key");
    tag.tagName = common::db::getOptionalString(row, "tag_name");
    tag.uuid = common::db::getString(row, "uuid");
    tag.unit = common::db::getOptionalString(row, "unit");
    tag.remarks = common::db::getOptionalString(row, "remarks");
    return tag;
}

void TagRepository::loadOptions(Tag& tag) {
    if (tag.tagType != TagType::Enum) {
        tag.options.reset();
        return;
    }

    Json::Value result = executor_->executeQuery(
        "SELECT id, tag_descriptor_id, \"order\", value, uuid, name FROM tag_enum_option "
        "WHERE tag_descriptor_id = ? AND deleted_at IS NULL ORDER BY \"order\", id",
        {static_cast<int64_t>(tag.id)});

    std::vector<domain::models::TagOption> options;
    for (const auto& row : result) {
        options.push_back(TagOptionRepository::jsonToModel(row));
    }
    tag.options = std::move(options);
}

} // namespace repositories
