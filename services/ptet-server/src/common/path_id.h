#pragma once

/**
 * @file path_id.h
 * @brief Resource ids taken from URL path segments
 */

#include <cstdint>
#include <string>

namespace common {

/**
 * Parse an id path segment.
 * @throws ApiError 404 when the segment is not an unsigned 32-bit integer
 */
uint32_t parsePathId(const std::string& segment);

} // namespace common
