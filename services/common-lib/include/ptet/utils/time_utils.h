/**
 * @file time_utils.h
 * @brief Time and date utilities
 *
 * RFC 3339 formatting and parsing plus conversion between
 * std::chrono time points and UNIX seconds (JWT NumericDate).
 *
 * All formatted values are UTC, e.g. "2025-03-01T15:15:00Z"; a non-zero
 * sub-second part is written with 3, 6 or 9 digits ("...15:15:00.500Z").
 *
 * @date 2026-03-24
 */

#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <optional>

namespace ptet {
namespace utils {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Format time_point as RFC 3339 UTC string
 *
 * @param tp std::chrono time_point
 * @return RFC 3339 string (e.g., "2026-02-02T12:34:56Z", "2026-02-02T12:34:56.250Z")
 */
std::string formatRfc3339(const TimePoint& tp);

/**
 * @brief Parse RFC 3339 string to time_point
 *
 * Accepts "YYYY-MM-DDTHH:MM:SS", an optional fraction, and either "Z"
 * or a numeric offset ("+01:00"). Offsets are normalised to UTC. The
 * fraction is kept down to nanoseconds.
 *
 * @param text RFC 3339 formatted string
 * @return std::chrono time_point, or std::nullopt when malformed
 */
std::optional<TimePoint> parseRfc3339(const std::string& text);

/**
 * @brief Seconds since the UNIX epoch
 */
int64_t toUnixSeconds(const TimePoint& tp);

/**
 * @brief time_point from seconds since the UNIX epoch
 */
TimePoint fromUnixSeconds(int64_t seconds);

/**
 * @brief Get current time as time_point
 */
inline TimePoint now() {
    return std::chrono::system_clock::now();
}

} // namespace utils
} // namespace ptet
