/**
 * @file binary_codec.cpp
 * @brief UUID layout encoding and strict decoding
 */

#include "person/uuid/binary_codec.h"
#include "person/uuid/bcd_codec.h"
#include "person/uuid/luhn.h"
#include "exception/exceptions.h"
#include <spdlog/spdlog.h>

namespace person::uuid {

namespace {

unsigned typeField(uint64_t low) {
    return static_cast<unsigned>((low >> layout::LSB_TYPE_SHIFT) & 0xF);
}

bool hasReservedBits(uint64_t high, uint64_t low) {
    return (high & layout::MSB_VERSION_MASK) == layout::MSB_VERSION &&
           (low & layout::LSB_MASK) == layout::LSB_RESERVED;
}

} // namespace

shared::util::Uuid encode(const IdentityRecord& record) {
    shared::util::Uuid uuid;
    uuid.msb = (encodeDigits(record.getNumber(), NUMBER_DIGITS) << layout::MSB_NUMBER_SHIFT) |
               layout::MSB_VERSION |
               encodeDigits(record.getSerial(), SERIAL_DIGITS);
    uuid.lsb = layout::LSB_RESERVED |
               (static_cast<uint64_t>(idTypeCode(record.getType())) << layout::LSB_TYPE_SHIFT);
    return uuid;
}

IdentityRecord decode(uint64_t high, uint64_t low) {
    shared::util::Uuid uuid{high, low};

    if (!hasReservedBits(high, low)) {
        spdlog::debug("Not a person UUID: {}", shared::util::UuidUtil::toString(uuid));
        throw common::NonConformantBinaryException(
            "reserved bits or node id mismatch in " + shared::util::UuidUtil::toString(uuid));
    }

    auto type = idTypeFromCode(typeField(low));
    if (!type) {
        spdlog::debug("Bad type code {} in {}", typeField(low), shared::util::UuidUtil::toString(uuid));
        throw common::NonConformantBinaryException(
            "invalid type code " + std::to_string(typeField(low)) + " in " + shared::util::UuidUtil::toString(uuid));
    }

    uint64_t number = decodeDigits(high >> layout::MSB_NUMBER_SHIFT, NUMBER_DIGITS);
    auto serial = static_cast<unsigned>(decodeDigits(high & layout::MSB_SERIAL_MASK, SERIAL_DIGITS));

    return IdentityRecord::restore(number, serial, *type);
}

IdentityRecord decode(const shared::util::Uuid& uuid) {
    return decode(uuid.msb, uuid.lsb);
}

bool isConformant(uint64_t high, uint64_t low) noexcept {
    if (!hasReservedBits(high, low) || !idTypeFromCode(typeField(low))) {
        return false;
    }

    uint64_t digits = high >> layout::MSB_NUMBER_SHIFT;
    if (!isDecimal(digits, NUMBER_DIGITS) || !isDecimal(high & layout::MSB_SERIAL_MASK, SERIAL_DIGITS)) {
        return false;
    }

    // all nybbles are decimal here, decodeDigits cannot throw
    return isLuhnValid(decodeDigits(digits, NUMBER_DIGITS));
}

bool isConformant(const shared::util::Uuid& uuid) noexcept {
    return isConformant(uuid.msb, uuid.lsb);
}

} // namespace person::uuid
