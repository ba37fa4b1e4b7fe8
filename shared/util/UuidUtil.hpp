/**
 * @file UuidUtil.hpp
 * @brief UUID value and text conversion on top of libuuid
 *
 * @date 2026-10-18
 */

#pragma once

#include <uuid/uuid.h>
#include <cstdint>
#include <optional>
#include <string>

namespace shared::util {

/**
 * 128-bit UUID value held as two 64-bit halves.
 */
struct Uuid {
    uint64_t msb = 0;  ///< time_low, time_mid, time_hi_and_version
    uint64_t lsb = 0;  ///< clock_seq and node

    bool operator==(const Uuid& other) const {
        return msb == other.msb && lsb == other.lsb;
    }

    bool operator!=(const Uuid& other) const {
        return !(*this == other);
    }
};

/**
 * UUID text utility.
 */
class UuidUtil {
public:
    static constexpr size_t TEXT_LENGTH = 36;

    /**
     * Format as lowercase xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx.
     */
    static std::string toString(const Uuid& uuid) {
        uuid_t bytes;
        toBytes(uuid, bytes);

        char str[TEXT_LENGTH + 1];
        uuid_unparse_lower(bytes, str);
        return std::string(str);
    }

    /**
     * Validate UUID format.
     */
    static bool isValid(const std::string& uuid) {
        return parse(uuid).has_value();
    }

    /**
     * Parse UUID text, upper or lower case.
     * @return std::nullopt if the text is not a UUID
     */
    static std::optional<Uuid> parse(const std::string& uuid) {
        // c_str() would hide an embedded NUL from uuid_parse
        if (uuid.length() != TEXT_LENGTH || uuid.find('\0') != std::string::npos) {
            return std::nullopt;
        }

        uuid_t bytes;
        if (uuid_parse(uuid.c_str(), bytes) != 0) {
            return std::nullopt;
        }
        return fromBytes(bytes);
    }

private:
    static void toBytes(const Uuid& uuid, uuid_t bytes) {
        for (int i = 0; i < 8; ++i) {
            bytes[i] = static_cast<unsigned char>(uuid.msb >> (56 - 8 * i));
            bytes[8 + i] = static_cast<unsigned char>(uuid.lsb >> (56 - 8 * i));
        }
    }

    static Uuid fromBytes(const uuid_t bytes) {
        Uuid uuid;
        for (int i = 0; i < 8; ++i) {
            uuid.msb = (uuid.msb << 8) | bytes[i];
            uuid.lsb = (uuid.lsb << 8) | bytes[8 + i];
        }
        return uuid;
    }
};

} // namespace shared::util
