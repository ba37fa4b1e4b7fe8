/**
 * @file luhn.cpp
 * @brief Luhn check digit implementation
 */

#include "person/uuid/luhn.h"

namespace person::uuid {

unsigned luhn(uint32_t payload) {
    unsigned sum = 0;
    unsigned shift = 1;
    while (payload != 0) {
        unsigned n = (payload % 10) << shift;
        sum += n % 10 + n / 10;
        shift ^= 1;
        payload /= 10;
    }

    return (10 - (sum % 10)) % 10;
}

bool isLuhnValid(uint64_t number) {
    auto payload = static_cast<uint32_t>((number / 10) % 1000000000ULL);
    return number % 10 == luhn(payload);
}

} // namespace person::uuid
