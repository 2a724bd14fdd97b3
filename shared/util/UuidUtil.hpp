#pragma once

#include <string>
#include <uuid/uuid.h>

namespace shared::util {

/**
 * UUID generation utility (libuuid).
 */
class UuidUtil {
public:
    /**
     * Generate a random (version 4) UUID in lower-case canonical form.
     */
    static std::string generate() {
        uuid_t uuid;
        uuid_generate_random(uuid);

        char str[37];
        uuid_unparse_lower(uuid, str);
        return std::string(str);
    }

    /**
     * Validate UUID format.
     */
    static bool isValid(const std::string& uuid) {
        if (uuid.length() != 36) {
            return false;
        }
        uuid_t parsed;
        return uuid_parse(uuid.c_str(), parsed) == 0;
    }
};

} // namespace shared::util
