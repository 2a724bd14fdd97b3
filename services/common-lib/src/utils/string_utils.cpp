/**
 * @file string_utils.cpp
 * @brief Common string utility functions implementation
 */

#include "ptet/utils/string_utils.h"
#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>
#include <openssl/rand.h>

namespace ptet {
namespace utils {

std::string toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string trim(const std::string& str) {
    size_t start = 0;
    while (start < str.length() && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }

    if (start == str.length()) {
        return "";
    }

    size_t end = str.length();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }

    return str.substr(start, end - start);
}

bool startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

std::optional<uint32_t> parseUnsigned(const std::string& str) {
    if (str.empty() || str.size() > 10) {
        return std::nullopt;
    }
    uint64_t value = 0;
    for (char c : str) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    if (value > std::numeric_limits<uint32_t>::max()) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(value);
}

std::optional<int64_t> parseInt64(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        long long value = std::stoll(str, &consumed, 10);
        if (consumed != str.size()) {
            return std::nullopt;
        }
        return static_cast<int64_t>(value);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::string randomAlphanumeric(size_t length) {
    static const char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
    // 62 * 4 = 248; bytes >= 248 are rejected to keep the distribution uniform
    constexpr unsigned char limit = 248;

    std::string result;
    result.reserve(length);
    unsigned char buffer[64];
    while (result.size() < length) {
        if (RAND_bytes(buffer, sizeof(buffer)) != 1) {
            throw std::runtime_error("Random number generator failed");
        }
        for (unsigned char byte : buffer) {
            if (byte >= limit) {
                continue;
            }
            result.push_back(alphabet[byte % 62]);
            if (result.size() == length) {
                break;
            }
        }
    }
    return result;
}

} // namespace utils
} // namespace ptet
