/**
 * @file luhn.h
 * @brief Luhn (mod 10) check digit for Swedish identity numbers
 *
 * The check digit covers the 9 digits before it; century digits of a
 * 12-digit number are outside the window.
 */

#pragma once

#include <cstdint>

namespace person::uuid {

/**
 * @brief Compute the check digit for a 9-digit payload
 *
 * Digits are processed from least significant, doubling every other digit
 * starting with the least significant one.
 *
 * @param payload Digits preceding the check digit
 * @return Check digit 0..9
 */
unsigned luhn(uint32_t payload);

/**
 * @brief Check the last digit of number against the Luhn digit of the 9 before it
 */
bool isLuhnValid(uint64_t number);

} // namespace person::uuid
