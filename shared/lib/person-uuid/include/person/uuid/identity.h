/**
 * @file identity.h
 * @brief Validated, immutable identity record
 *
 * A record exists only if its number passed range, checksum and (for fresh
 * construction) classification and date checks. There is no invalid state.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include "types.h"
#include "util/UuidUtil.hpp"

namespace person::uuid {

/**
 * @brief Identity number with serial and type
 */
class IdentityRecord {
private:
    uint64_t number_;
    unsigned serial_;
    IdType type_;

    IdentityRecord(uint64_t number, unsigned serial, IdType type, bool verifyType);

public:
    /**
     * @brief Construct from a raw number, deriving the type
     *
     * @param number Identity number, 10 or 12 digit forms
     * @param serial Serial number 0..999
     * @throws common::MalformedNumberException number or serial out of range
     * @throws common::ChecksumMismatchException bad check digit
     * @throws common::InvalidDateException bad PERSNR/SAMNR date
     * @throws common::UnclassifiableNumberException unknown digit pattern
     */
    explicit IdentityRecord(uint64_t number, unsigned serial = 0);

    /**
     * @brief Construct from a raw number with an expected type
     *
     * Same checks as the deriving constructor, plus the derived type must
     * equal type (UnclassifiableNumberException otherwise).
     */
    IdentityRecord(uint64_t number, unsigned serial, IdType type);

    /**
     * @brief Rebuild a record from already encoded fields
     *
     * Checks range and check digit only; type is trusted and the date is
     * not re-validated. Used by the binary decoder.
     */
    static IdentityRecord restore(uint64_t number, unsigned serial, IdType type);

    [[nodiscard]] uint64_t getNumber() const noexcept {
        return number_;
    }

    [[nodiscard]] unsigned getSerial() const noexcept {
        return serial_;
    }

    [[nodiscard]] IdType getType() const noexcept {
        return type_;
    }

    /**
     * @brief Binary encoding of this record
     */
    [[nodiscard]] shared::util::Uuid toUuid() const;

    /**
     * @brief Canonical UUID text, e.g. "19410617-7753-1099-9001-d59a20d06c1a"
     */
    [[nodiscard]] std::string toString() const;

    /**
     * @brief Hyphenated number, "YYYYMMDD-NNNN" or "NNNNNN-NNNN" below 10^10
     */
    [[nodiscard]] std::string formatNumber() const;

    bool operator==(const IdentityRecord& other) const {
        return number_ == other.number_ && serial_ == other.serial_ && type_ == other.type_;
    }

    bool operator!=(const IdentityRecord& other) const {
        return !(*this == other);
    }

    /// Orders by type code, then number, then serial
    bool operator<(const IdentityRecord& other) const;
};

} // namespace person::uuid

namespace std {

template<>
struct hash<person::uuid::IdentityRecord> {
    size_t operator()(const person::uuid::IdentityRecord& record) const noexcept {
        size_t h = std::hash<uint64_t>()(record.getNumber());
        h ^= std::hash<unsigned>()(record.getSerial()) + 0x9e3779b9 + (h << 6) + (h >> 2);
        h ^= std::hash<unsigned>()(person::uuid::idTypeCode(record.getType())) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};

} // namespace std
