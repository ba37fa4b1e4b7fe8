/**
 * @file bcd_codec.h
 * @brief Binary-coded decimal packing into a 64-bit word
 *
 * One decimal digit per nybble, least significant digit at bit 0.
 */

#pragma once

#include <cstdint>

namespace person::uuid {

/**
 * @brief Pack the low digitCount decimal digits of number into nybbles
 *
 * Nybble i (bits 4i..4i+3) holds the i-th least significant digit.
 * Higher digits are truncated.
 *
 * @param number Non-negative number
 * @param digitCount Number of digits to place (at most 16)
 * @return BCD word
 */
uint64_t encodeDigits(uint64_t number, int digitCount);

/**
 * @brief Unpack digitCount nybbles starting at bit 0 into a decimal number
 *
 * @param word BCD word
 * @param digitCount Number of nybbles to read (at most 16)
 * @return Decimal value
 * @throws common::NonConformantBinaryException if a nybble is above 9
 */
uint64_t decodeDigits(uint64_t word, int digitCount);

/**
 * @brief Check that the low digitCount nybbles are all decimal digits
 */
bool isDecimal(uint64_t word, int digitCount) noexcept;

} // namespace person::uuid
