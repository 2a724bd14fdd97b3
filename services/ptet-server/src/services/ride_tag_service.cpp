/**
 * @file ride_tag_service.cpp
 * @brief RideTagService implementation
 */

#include "ride_tag_service.h"
#include "../common/api_error.h"
#include "exceptions.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace services {

using domain::models::RideTagLink;
using domain::models::RideTagWithTag;

RideTagService::RideTagService(repositories::RideRepository* rideRepo,
                               repositories::TagRepository* tagRepo,
                               repositories::RideTagLinkRepository* linkRepo)
    : rideRepo_(rideRepo), tagRepo_(tagRepo), linkRepo_(linkRepo)
{
    if (!rideRepo_ || !tagRepo_ || !linkRepo_) {
        throw std::invalid_argument("RideTagService: repositories cannot be nullptr");
    }
    spdlog::debug("[RideTagService] Initialized");
}

RideTagService::ListResult RideTagService::list(uint32_t userId, uint32_t rideId,
                                                const std::optional<common::PageRequest>& page) {
    rideRepo_->requireOwner(rideId, userId);

    ListResult result;
    result.totalItems = linkRepo_->countAll(rideId);

    auto links = page
        ? linkRepo_->findAll(rideId, page->limit(), page->offset())
        : linkRepo_->findAll(rideId);

    result.items.reserve(links.size());
    for (auto& link : links) {
        auto tag = tagRepo_->findById(link.tagId);
        result.items.push_back(RideTagWithTag{std::move(link), std::move(tag)});
    }
    return result;
}

RideTagWithTag RideTagService::getByTag(uint32_t userId, uint32_t rideId, uint32_t tagId) {
    rideRepo_->requireOwner(rideId, userId);
    tagRepo_->requireOwner(tagId, userId);

    auto link = linkRepo_->findByTagId(rideId, tagId);
    if (!link) {
        throw common::NotFoundException();
    }
    return RideTagWithTag{*link, tagRepo_->findById(tagId)};
}

RideTagLink RideTagService::create(uint32_t userId, uint32_t rideId, uint32_t tagId,
                                   const RideTagLink& link) {
    rideRepo_->requireOwner(rideId, userId);
    tagRepo_->requireOwner(tagId, userId);

    if (linkRepo_->findByTagId(rideId, tagId)) {
        spdlog::debug("[RideTagService] Tag {} is already linked to ride {}", tagId, rideId);
        throw common::ApiError::badRequest("Tag is already linked to this ride");
    }

    auto tag = tagRepo_->findById(tagId);
    link.value.validate(tag);

    return linkRepo_->insert(rideId, tagId, link);
}

RideTagWithTag RideTagService::getByLink(uint32_t userId, uint32_t linkId) {
    linkRepo_->requireOwner(linkId, userId);

    auto link = linkRepo_->findById(linkId);
    auto tag = tagRepo_->findById(link.tagId);
    return RideTagWithTag{std::move(link), std::move(tag)};
}

void RideTagService::update(uint32_t userId, uint32_t linkId, const RideTagLink& link) {
    linkRepo_->requireOwner(linkId, userId);

    auto existing = linkRepo_->findById(linkId);
    auto tag = tagRepo_->findById(existing.tagId);
    link.value.validate(tag);

    linkRepo_->update(linkId, link);
}

void RideTagService::remove(uint32_t userId, uint32_t linkId) {
    linkRepo_->requireOwner(linkId, userId);
    linkRepo_->remove(linkId);
}

} // namespace services
