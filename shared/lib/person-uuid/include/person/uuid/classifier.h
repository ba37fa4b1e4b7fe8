/**
 * @file classifier.h
 * @brief Identity type classification from the digit pattern
 *
 * Pure function of the number. Checks in priority order:
 *   - GDNR:   leading digits 302 (number / 10^7 == 302)
 *   - ORGNR:  century marker 0 or 16, "month" 20 or above
 *   - PERSNR: century 18 or later, month 1..12, day 1..31, real date
 *   - SAMNR:  month 1..12, day 61..91, real date after subtracting 60
 */

#pragma once

#include <cstdint>
#include <optional>
#include "types.h"

namespace person::uuid {

/// @brief Date fields read from a number in the 12-digit layout
struct DateParts {
    int year = 0;   ///< Century and year, number / 10^8
    int month = 0;  ///< (number / 10^6) % 100
    int day = 0;    ///< (number / 10^4) % 100
};

/**
 * @brief Split number into its year, month and day groups
 */
DateParts dateParts(uint64_t number);

/**
 * @brief Derive the identity type of a raw number
 *
 * @param number Identity number, at most 12 digits
 * @return Identity type
 * @throws common::MalformedNumberException if number has more than 12 digits
 * @throws common::InvalidDateException if a PERSNR/SAMNR date is not real
 * @throws common::UnclassifiableNumberException if no category matches
 */
IdType classify(uint64_t number);

/**
 * @brief Non-throwing classify
 * @return Identity type, or std::nullopt if classify would throw
 */
std::optional<IdType> tryClassify(uint64_t number);

} // namespace person::uuid
