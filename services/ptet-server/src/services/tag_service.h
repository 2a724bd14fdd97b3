#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include "../common/pagination.h"
#include "../domain/models/tag.h"
#include "../domain/models/tag_option.h"
#include "../repositories/tag_option_repository.h"
#include "../repositories/tag_repository.h"

/**
 * @file tag_service.h
 * @brief Tag Service - tag descriptors and their enum options
 *
 * Responsibilities:
 * - Ownership checks on tags, and on options through their tag
 * - Options are only reachable while their tag is owned and not deleted
 *
 * Does NOT handle:
 * - Links between tags and rides (RideTagService's job)
 *
 * @date 2026-03-25
 */

namespace services {

class TagService {
public:
    struct TagList {
        std::vector<domain::models::Tag> items;
        int64_t totalItems = 0;
    };

    struct OptionList {
        std::vector<domain::models::TagOption> items;
        int64_t totalItems = 0;
    };

    /**
     * @brief Constructor with Repository Dependency Injection (non-owning pointers)
     * @throws std::invalid_argument if a repository is nullptr
     */
    TagService(repositories::TagRepository* tagRepo,
               repositories::TagOptionRepository* optionRepo);

    // --- Tags ---

    TagList list(uint32_t userId, const std::optional<common::PageRequest>& page = std::nullopt);
    domain::models::Tag create(uint32_t userId, const domain::models::Tag& tag);

    /// @throws common::NotFoundException when the tag is not the user's
    domain::models::Tag get(uint32_t userId, uint32_t tagId);
    void update(uint32_t userId, uint32_t tagId, const domain::models::Tag& tag);
    void remove(uint32_t userId, uint32_t tagId);

    // --- Options ---

    /// @throws common::NotFoundException when the tag is not the user's
    OptionList listOptions(uint32_t userId, uint32_t tagId,
                           const std::optional<common::PageRequest>& page = std::nullopt);
    domain::models::TagOption createOption(uint32_t userId, uint32_t tagId,
                                           const domain::models::TagOption& option);

    /// @throws common::NotFoundException when the option's tag is not the user's
    domain::models::TagOption getOption(uint32_t userId, uint32_t optionId);
    void updateOption(uint32_t userId, uint32_t optionId, const domain::models::TagOption& option);
    void removeOption(uint32_t userId, uint32_t optionId);

private:
    repositories::TagRepository* tagRepo_;
    repositories::TagOptionRepository* optionRepo_;
};

} // namespace services
