/**
 * @file tag_service.cpp
 * @brief TagService implementation
 */

#include "tag_service.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace services {

using domain::models::Tag;
using domain::models::TagOption;

TagService::TagService(repositories::TagRepository* tagRepo,
                       repositories::TagOptionRepository* optionRepo)
    : tagRepo_(tagRepo), optionRepo_(optionRepo)
{
    if (!tagRepo_ || !optionRepo_) {
        throw std::invalid_argument("TagService: repositories cannot be nullptr");
    }
    spdlog::debug("[TagService] Initialized");
}

TagService::TagList TagService::list(uint32_t userId,
                                     const std::optional<common::PageRequest>& page) {
    TagList result;
    result.totalItems = tagRepo_->countAll(userId);
    result.items = page
        ? tagRepo_->findAll(userId, page->limit(), page->offset())
        : tagRepo_->findAll(userId);
    return result;
}

Tag TagService::create(uint32_t userId, const Tag& tag) {
    return tagRepo_->insert(userId, tag);
}

Tag TagService::get(uint32_t userId, uint32_t tagId) {
    tagRepo_->requireOwner(tagId, userId);
    return tagRepo_->findById(tagId);
}

void TagService::update(uint32_t userId, uint32_t tagId, const Tag& tag) {
    tagRepo_->requireOwner(tagId, userId);
    tagRepo_->update(tagId, tag);
}

void TagService::remove(uint32_t userId, uint32_t tagId) {
    tagRepo_->requireOwner(tagId, userId);
    tagRepo_->remove(tagId);
}

TagService::OptionList TagService::listOptions(uint32_t userId, uint32_t tagId,
                                               const std::optional<common::PageRequest>& page) {
    tagRepo_->requireOwner(tagId, userId);

    OptionList result;
    result.totalItems = optionRepo_->countAll(tagId);
    result.items = page
        ? optionRepo_->findAll(tagId, page->limit(), page->offset())
        : optionRepo_->findAll(tagId);
    return result;
}

TagOption TagService::createOption(uint32_t userId, uint32_t tagId, const TagOption& option) {
    tagRepo_->requireOwner(tagId, userId);
    return optionRepo_->insert(tagId, option);
}

TagOption TagService::getOption(uint32_t userId, uint32_t optionId) {
    optionRepo_->requireOwner(optionId, userId);
    return optionRepo_->findById(optionId);
}

void TagService::updateOption(uint32_t userId, uint32_t optionId, const TagOption& option) {
    optionRepo_->requireOwner(optionId, userId);
    optionRepo_->update(optionId, option);
}

void TagService::removeOption(uint32_t userId, uint32_t optionId) {
    optionRepo_->requireOwner(optionId, userId);
    optionRepo_->remove(optionId);
}

} // namespace services
