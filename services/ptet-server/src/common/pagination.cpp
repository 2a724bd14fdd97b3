/**
 * @file pagination.cpp
 * @brief Page parameter parsing and Link header construction
 */

#include "pagination.h"
#include "api_error.h"
#include "ptet/utils/string_utils.h"
#include <limits>
#include <sstream>

namespace common {

namespace {

std::optional<uint64_t> parseU64(const std::string& text) {
    if (text.empty() || text.size() > 19) {
        return std::nullopt;
    }
    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    return value;
}

std::string linkEntry(const std::string& path, uint64_t page, uint64_t size, const char* rel) {
    std::ostringstream os;
    os << '<' << path << "?page=" << page << "&size=" << size << ">; rel=\"" << rel << '"';
    return os.str();
}

} // namespace

std::optional<PageRequest> parsePageRequest(const std::string& page, const std::string& size) {
    std::string pageText = ptet::utils::trim(page);
    std::string sizeText = ptet::utils::trim(size);
    if (pageText.empty() && sizeText.empty()) {
        return std::nullopt;
    }
    if (pageText.empty() || sizeText.empty()) {
        throw ApiError::badRequest("Both 'page' and 'size' must be given");
    }

    auto pageValue = parseU64(pageText);
    auto sizeValue = parseU64(sizeText);
    if (!pageValue) {
        throw ApiError::badRequest("Query parameter 'page' must be an unsigned integer");
    }
    if (!sizeValue || *sizeValue == 0) {
        throw ApiError::badRequest("Query parameter 'size' must be a positive integer");
    }

    // offset and limit are bound as signed 64-bit SQL integers
    const uint64_t maxValue = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    if (*sizeValue > maxValue) {
        throw ApiError::badRequest("Query parameter 'size' is too large");
    }
    if (*pageValue > maxValue / *sizeValue) {
        throw ApiError::badRequest("Query parameters 'page' and 'size' select an offset that is too large");
    }
    return PageRequest{*pageValue, *sizeValue};
}

uint64_t pageCount(uint64_t totalItems, uint64_t size) {
    if (size == 0) {
        return 0;
    }
    return (totalItems + size - 1) / size;
}

HeaderList pageHeaders(const std::string& path, uint64_t totalItems, const PageRequest& request) {
    uint64_t pages = pageCount(totalItems, request.size);
    uint64_t last = pages > 0 ? pages - 1 : 0;

    std::vector<std::string> links;
    links.push_back(linkEntry(path, request.page, request.size, "self"));
    links.push_back(linkEntry(path, 0, request.size, "first"));
    links.push_back(linkEntry(path, last, request.size, "last"));
    if (request.page > 0) {
        uint64_t prev = request.page <= last ? request.page - 1 : last;
        links.push_back(linkEntry(path, prev, request.size, "prev"));
    }
    if (request.page < last) {
        links.push_back(linkEntry(path, request.page + 1, request.size, "next"));
    }

    std::string link;
    for (size_t i = 0; i < links.size(); ++i) {
        if (i > 0) {
            link += ", ";
        }
        link += links[i];
    }

    return {
        {"X-Total-Items", std::to_string(totalItems)},
        {"X-Page", std::to_string(request.page)},
        {"X-Page-Size", std::to_string(request.size)},
        {"X-Total-pages", std::to_string(pages)},
        {"Link", link},
    };
}

HeaderList completeHeaders(uint64_t totalItems) {
    return {{"X-Total-Items", std::to_string(totalItems)}};
}

} // namespace common
