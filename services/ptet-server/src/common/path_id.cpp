/**
 * @file path_id.cpp
 * @brief Path id parsing
 */

#include "path_id.h"
#include "api_error.h"
#include "ptet/utils/string_utils.h"

namespace common {

uint32_t parsePathId(const std::string& segment) {
    auto id = ptet::utils::parseUnsigned(segment);
    if (!id) {
        throw ApiError::notFound();
    }
    return *id;
}

} // namespace common
