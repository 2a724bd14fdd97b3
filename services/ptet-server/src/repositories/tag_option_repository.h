#pragma once

/**
 * @file tag_option_repository.h
 * @brief Repository for the tag_enum_option table
 */

#include <vector>
#include <json/json.h>
#include "i_query_executor.h"
#include "../domain/models/tag_option.h"

namespace repositories {

class TagOptionRepository {
public:
    explicit TagOptionRepository(common::IQueryExecutor* executor);
    ~TagOptionRepository();

    /**
     * @brief Non-deleted options of a tag ordered by "order", then id
     * @param limit -1 for all rows
     */
    std::vector<domain::models::TagOption> findAll(uint32_t tagId, int64_t limit = -1,
                                                   int64_t offset = 0);

    int64_t countAll(uint32_t tagId);

    /**
     * @throws common::NotFoundException when missing or deleted
     */
    domain::models::TagOption findById(uint32_t id);

    /**
     * @brief Check that the option exists and its tag belongs to the user
     * @throws common::NotFoundException otherwise (deleted rows do not count)
     */
    void requireOwner(uint32_t optionId, uint32_t userId);

    /**
     * @brief Insert an option with a fresh UUID
     * @return stored option
     */
    domain::models::TagOption insert(uint32_t tagId, const domain::models::TagOption& option);

    /**
     * @brief Replace order, value and name; the UUID is kept
     * @throws common::NotFoundException when nothing was updated
     */
    void update(uint32_t id, const domain::models::TagOption& option);

    /**
     * @brief Soft delete
     * @throws common::NotFoundException when missing or already deleted
     */
    void remove(uint32_t id);

    static domain::models::TagOption jsonToModel(const Json::Value& row);

private:
    common::IQueryExecutor* executor_;
};

} // namespace repositories
