/**
 * @file string_utils.h
 * @brief Common string utility functions
 *
 * Small helpers shared by the key store, the token tool and the
 * HTTP layer (trimming, number parsing, random identifiers).
 *
 * @date 2026-03-24
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace ptet {
namespace utils {

/**
 * @brief Convert ASCII string to lowercase
 */
std::string toLower(const std::string& str);

/**
 * @brief Remove leading and trailing whitespace
 */
std::string trim(const std::string& str);

/**
 * @brief Check if string starts with prefix
 */
bool startsWith(const std::string& str, const std::string& prefix);

/**
 * @brief Parse a base-10 unsigned 32-bit number
 *
 * @return value, or std::nullopt for empty input, signs, non-digits or overflow
 */
std::optional<uint32_t> parseUnsigned(const std::string& str);

/**
 * @brief Parse a base-10 signed 64-bit number
 *
 * @return value, or std::nullopt when the whole string is not a number
 */
std::optional<int64_t> parseInt64(const std::string& str);

/**
 * @brief Random string over [A-Za-z0-9]
 *
 * Uses OpenSSL's CSPRNG; used for key ids and JWT ids.
 *
 * @throws std::runtime_error if the random generator fails
 */
std::string randomAlphanumeric(size_t length);

} // namespace utils
} // namespace ptet
