#pragma once

/**
 * @file tag_repository.h
 * @brief Repository for the tag_descriptor table
 *
 * Tags of type enum are returned with their non-deleted options; other
 * tags have no option list.
 */

#include <vector>
#include <json/json.h>
#include "i_query_executor.h"
#include "../domain/models/tag.h"

namespace repositories {

class TagRepository {
public:
    explicit TagRepository(common::IQueryExecutor* executor);
    ~TagRepository();

    /**
     * @brief Non-deleted tags of a user ordered by id
     * @param limit -1 for all rows
     */
    std::vector<domain::models::Tag> findAll(uint32_t userId, int64_t limit = -1,
                                             int64_t offset = 0);

    int64_t countAll(uint32_t userId);

    /**
     * @throws common::NotFoundException when missing or deleted
     */
    domain::models::Tag findById(uint32_t id);

    /**
     * @brief Check that the tag exists, is not deleted and belongs to the user
     * @throws common::NotFoundException otherwise
     */
    void requireOwner(uint32_t tagId, uint32_t userId);

    /**
     * @brief Insert a tag with a fresh UUID
     * @return stored tag (enum tags start with an empty option list)
     */
    domain::models::Tag insert(uint32_t userId, const domain::models::Tag& tag);

    /**
     * @brief Replace type, key, name, unit and remarks; the UUID is kept
     * @throws common::NotFoundException when nothing was updated
     */
    void update(uint32_t id, const domain::models::Tag& tag);

    /**
     * @brief Soft delete
     * @throws common::NotFoundException when missing or already deleted
     */
    void remove(uint32_t id);

private:
    common::IQueryExecutor* executor_;

    domain::models::Tag jsonToModel(const Json::Value& row);
    void loadOptions(domain::models::Tag& tag);
};

} // namespace repositories
