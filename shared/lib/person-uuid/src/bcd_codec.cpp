/**
 * @file bcd_codec.cpp
 * @brief BCD nybble packing implementation
 */

#include "person/uuid/bcd_codec.h"
#include "exception/exceptions.h"
#include <spdlog/spdlog.h>
#include <sstream>
#include <iomanip>

namespace person::uuid {

uint64_t encodeDigits(uint64_t number, int digitCount) {
    uint64_t word = 0;
    for (int i = 0; i < digitCount; i++, number /= 10) {
        word |= (number % 10) << (i * 4);
    }
    return word;
}

uint64_t decodeDigits(uint64_t word, int digitCount) {
    if (digitCount < 16) {
        word &= (1ULL << (digitCount * 4)) - 1;
    }

    uint64_t result = 0;
    for (int i = digitCount - 1; i >= 0; i--) {
        uint64_t digit = (word >> (i * 4)) & 0xF;
        if (digit > 9) {
            std::ostringstream oss;
            oss << std::hex << std::setfill('0') << std::setw(digitCount) << word;
            spdlog::debug("BCD decode rejected nybble {:x} in {}", digit, oss.str());
            throw common::NonConformantBinaryException(
                "non-decimal digit in BCD field " + oss.str());
        }
        result = result * 10 + digit;
    }
    return result;
}

bool isDecimal(uint64_t word, int digitCount) noexcept {
    for (int i = 0; i < digitCount; i++) {
        if (((word >> (i * 4)) & 0xF) > 9) {
            return false;
        }
    }
    return true;
}

} // namespace person::uuid
