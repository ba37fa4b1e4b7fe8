/**
 * @file identity.cpp
 * @brief Identity record construction and formatting
 */

#include "person/uuid/identity.h"
#include "person/uuid/binary_codec.h"
#include "person/uuid/classifier.h"
#include "person/uuid/luhn.h"
#include "exception/exceptions.h"
#include <spdlog/spdlog.h>
#include <iomanip>
#include <sstream>
#include <tuple>

namespace person::uuid {

namespace {

void checkRange(uint64_t number, unsigned serial) {
    if (number > MAX_NUMBER) {
        throw common::MalformedNumberException(std::to_string(number) + " has more than 12 digits");
    }
    if (serial > MAX_SERIAL) {
        throw common::MalformedNumberException("serial " + std::to_string(serial) + " exceeds 999");
    }
}

void checkDigit(uint64_t number) {
    if (!isLuhnValid(number)) {
        auto expected = luhn(static_cast<uint32_t>((number / 10) % 1000000000ULL));
        spdlog::debug("Rejected identity {}: check digit {} expected {}", number, number % 10, expected);
        throw common::ChecksumMismatchException(
            "identity " + std::to_string(number) + ", expected check digit " + std::to_string(expected));
    }
}

} // namespace

IdentityRecord::IdentityRecord(uint64_t number, unsigned serial, IdType type, bool verifyType)
    : number_(number), serial_(serial), type_(type) {
    checkRange(number, serial);
    checkDigit(number);

    if (verifyType) {
        IdType actual = classify(number);
        if (actual != type) {
            throw common::UnclassifiableNumberException(
                std::to_string(number) + " is " + idTypeToString(actual) + ", not " + idTypeToString(type));
        }
    }
}

IdentityRecord::IdentityRecord(uint64_t number, unsigned serial)
    : number_(number), serial_(serial), type_(IdType::ORGNR) {
    checkRange(number, serial);
    checkDigit(number);
    type_ = classify(number);
}

IdentityRecord::IdentityRecord(uint64_t number, unsigned serial, IdType type)
    : IdentityRecord(number, serial, type, true) {}

IdentityRecord IdentityRecord::restore(uint64_t number, unsigned serial, IdType type) {
    return IdentityRecord(number, serial, type, false);
}

shared::util::Uuid IdentityRecord::toUuid() const {
    return encode(*this);
}

std::string IdentityRecord::toString() const {
    return shared::util::UuidUtil::toString(toUuid());
}

std::string IdentityRecord::formatNumber() const {
    std::ostringstream oss;
    oss << std::setfill('0');
    if (number_ < 10000000000ULL) {
        oss << std::setw(6) << number_ / 10000;
    } else {
        oss << std::setw(8) << number_ / 10000;
    }
    oss << '-' << std::setw(4) << number_ % 10000;
    return oss.str();
}

bool IdentityRecord::operator<(const IdentityRecord& other) const {
    return std::make_tuple(idTypeCode(type_), number_, serial_) <
           std::make_tuple(idTypeCode(other.type_), other.number_, other.serial_);
}

} // namespace person::uuid
