#pragma once

/**
 * @file pagination.h
 * @brief Page selection and response headers for list endpoints
 *
 * Clients pass "page" (0-based) and "size" as query parameters. Paged
 * responses carry X-Total-Items, X-Page, X-Page-Size, X-Total-pages and an
 * RFC 8288 Link header with self/first/last and, where they exist,
 * prev/next relations.
 *
 * @date 2026-03-25
 */

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace common {

struct PageRequest {
    uint64_t page = 0;
    uint64_t size = 0;

    int64_t limit() const { return static_cast<int64_t>(size); }
    int64_t offset() const { return static_cast<int64_t>(page * size); }
};

using HeaderList = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Interpret the page/size query parameters
 *
 * @return nullopt when both are empty (complete list requested)
 * @throws ApiError 400 when only one is given, either is not an unsigned
 *         integer, size is 0, or page * size does not fit in int64_t
 */
std::optional<PageRequest> parsePageRequest(const std::string& page, const std::string& size);

/// Number of pages needed for totalItems, ceil(totalItems / size)
uint64_t pageCount(uint64_t totalItems, uint64_t size);

/**
 * @brief Headers of a paged response
 * @param path Request path used as the Link target (without query)
 */
HeaderList pageHeaders(const std::string& path, uint64_t totalItems, const PageRequest& request);

/// Headers of a complete (unpaged) response
HeaderList completeHeaders(uint64_t totalItems);

} // namespace common
