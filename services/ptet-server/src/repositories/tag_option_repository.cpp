/** @file tag_option_repository.cpp
 *  @brief TagOptionRepository implementation
 */

#include "tag_option_repository.h"
#include "repository_utils.h"
#include "shared/util/UuidUtil.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace repositories {

using domain::models::TagOption;

namespace {
const char* const kSelectColumns =
    "SELECT id, tag_descriptor_id, \"order\", value, uuid, name FROM tag_enum_option ";
}

TagOptionRepository::TagOptionRepository(common::IQueryExecutor* executor)
    : executor_(executor)
{
    if (!executor_) {
        throw std::invalid_argument("TagOptionRepository: executor cannot be nullptr");
    }
    spdlog::debug("[TagOptionRepository] Initialized (DB type: {})", executor_->getDatabaseType());
}

TagOptionRepository::~TagOptionRepository() {}

std::vector<TagOption> TagOptionRepository::findAll(uint32_t tagId, int64_t limit, int64_t offset) {
    Json::Value result;
    try {
        result = executor_->executeQuery(
            std::string(kSelectColumns) +
            "WHERE tag_descriptor_id = ? AND deleted_at IS NULL "
            "ORDER BY \"order\", id LIMIT ? OFFSET ?",
            {static_cast<int64_t>(tagId), limit, offset});
    } catch (const common::DatabaseException& e) {
        spdlog::error("[TagOptionRepository] findAll failed: {}", e.what());
        throw;
    }

    std::vector<TagOption> items;
    for (const auto& row : result) {
        items.push_back(jsonToModel(row));
    }
    return items;
}

int64_t TagOptionRepository::countAll(uint32_t tagId) {
    try {
        Json::Value result = executor_->executeScalar(
            "SELECT COUNT(*) FROM tag_enum_option WHERE tag_descriptor_id = ? AND deleted_at IS NULL",
            {static_cast<int64_t>(tagId)});
        return common::db::scalarToInt64(result);
    } catch (const common::DatabaseException& e) {
        spdlog::error("[TagOptionRepository] countAll failed: {}", e.what());
        throw;
    }
}

TagOption TagOptionRepository::findById(uint32_t id) {
    Json::Value result;
    try {
        result = executor_->executeQuery(
            std::string(kSelectColumns) + "WHERE id = ? AND deleted_at IS NULL",
            {static_cast<int64_t>(id)});
    } catch (const common::DatabaseException& e) {
        spdlog::error("[TagOptionRepository] findById failed: {}", e.what());
        throw;
    }

    if (result.empty()) {
        throw common::NotFoundException();
    }
    return jsonToModel(result[0]);
}

void TagOptionRepository::requireOwner(uint32_t optionId, uint32_t userId) {
    Json::Value result;
    try {
        result = executor_->executeScalar(
            "SELECT COUNT(*) FROM tag_enum_option o "
            "JOIN tag_descriptor t ON t.id = o.tag_descriptor_id "
            "WHERE o.id = ? AND o.deleted_at IS NULL "
            "AND t.user_id = ? AND t.deleted_at IS NULL",
            {static_cast<int64_t>(optionId), static_cast<int64_t>(userId)});
    } catch (const common::DatabaseException& e) {
        spdlog::error("[TagOptionRepository] requireOwner failed: {}", e.what());
        throw;
    }

    if (common::db::scalarToInt64(result) == 0) {
        throw common::NotFoundException();
    }
}

TagOption TagOptionRepository::insert(uint32_t tagId, const TagOption& option) {
    std::string now = nowText();
    std::string uuid = shared::util::UuidUtil::generate();

    Json::Value result;
    try {
        result = executor_->executeQuery(
            "INSERT INTO tag_enum_option (created_at, updated_at, tag_descriptor_id, \"order\", "
            "                             value, uuid, name) "
            "VALUES (?, ?, ?, ?, ?, ?, ?) RETURNING id",
            {now, now, static_cast<int64_t>(tagId), static_cast<int64_t>(option.order),
             option.value, uuid, optionalText(option.name)});
    } catch (const common::DatabaseException& e) {
        spdlog::error("[TagOptionRepository] Insert failed: {}", e.what());
        throw;
    }

    if (result.empty()) {
        throw common::InternalException("Insert into tag_enum_option returned no id");
    }

    TagOption stored = option;
    stored.id = getId(result[0], "id");
    stored.tagId = tagId;
    stored.uuid = uuid;
    spdlog::info("[TagOptionRepository] Inserted option {} of tag {}", stored.id, tagId);
    return stored;
}

void TagOptionRepository::update(uint32_t id, const TagOption& option) {
    int rowsAffected = 0;
    try {
        rowsAffected = executor_->executeCommand(
            "UPDATE tag_enum_option SET updated_at = ?, \"order\" = ?, value = ?, name = ? "
            "WHERE id = ? AND deleted_at IS NULL",
            {nowText(), static_cast<int64_t>(option.order), option.value,
             optionalText(option.name), static_cast<int64_t>(id)});
    } catch (const common::DatabaseException& e) {
        spdlog::error("[TagOptionRepository] Update failed: {}", e.what());
        throw;
    }

    if (rowsAffected == 0) {
        throw common::NotFoundException();
    }
    spdlog::info("[TagOptionRepository] Updated option {}", id);
}

void TagOptionRepository::remove(uint32_t id) {
    int rowsAffected = 0;
    try {
        rowsAffected = executor_->executeCommand(
            "UPDATE tag_enum_option SET deleted_at = ? WHERE id = ? AND deleted_at IS NULL",
            {nowText(), static_cast<int64_t>(id)});
    } catch (const common::DatabaseException& e) {
        spdlog::error("[TagOptionRepository] Remove failed: {}", e.what());
        throw;
    }

    if (rowsAffected == 0) {
        throw common::NotFoundException();
    }
    spdlog::info("[TagOptionRepository] Deleted option {}", id);
}

TagOption TagOptionRepository::jsonToModel(const Json::Value& row) {
    TagOption option;
    option.id = getId(row, "id");
    option.tagId = getId(row, "tag_descriptor_id");
    option.order = static_cast<uint32_t>(common::db::getOptionalInt64(row, "order").value_or(0));
    option.value = common::db::getString(row, "value");
    option.uuid = common::db::getString(row, "uuid");
    option.name = common::db::getOptionalString(row, "name");
    return option;
}

} // namespace repositories
