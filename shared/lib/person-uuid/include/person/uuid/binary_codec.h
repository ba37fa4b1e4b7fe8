/**
 * @file binary_codec.h
 * @brief Identity record <-> 128-bit UUID layout
 *
 * Version 1 shaped UUID with a fixed multicast node id:
 *
 * <pre>
 *   iiiiiiii-iiii-1nnn-9xxt-d59a20d06c1a
 *   \___________/ |\_/ |  | \__________/
 *         |       | |  |  |       |
 *     id number   | |  |  |  fixed node id, multicast bit set
 *   1 digit per   | |  |  |
 *       nybble    | |  |  type code 0..3
 *                 | |  |
 *     version 1 --+ |  variant 10x with lsb of N forced to 1 (hex 9),
 *                   |  followed by 8 reserved zero bits
 *    serial, 3 BCD -+
 * </pre>
 */

#pragma once

#include <cstdint>
#include "identity.h"
#include "util/UuidUtil.hpp"

namespace person::uuid {

namespace layout {

constexpr uint64_t MSB_VERSION_MASK = 0x000000000000F000ULL;
constexpr uint64_t MSB_VERSION      = 0x0000000000001000ULL;
constexpr int      MSB_NUMBER_SHIFT = 16;
constexpr uint64_t MSB_SERIAL_MASK  = 0x0000000000000FFFULL;

constexpr uint64_t NODE_ID          = 0x0000d59a20d06c1aULL;
constexpr uint64_t LSB_MASK         = 0xFFF0FFFFFFFFFFFFULL;
constexpr uint64_t LSB_RESERVED     = 0x9000000000000000ULL | NODE_ID;
constexpr int      LSB_TYPE_SHIFT   = 48;

} // namespace layout

/**
 * @brief Assemble the UUID halves for a record
 */
shared::util::Uuid encode(const IdentityRecord& record);

/**
 * @brief Decode UUID halves into a record
 *
 * @param high Most significant 64 bits
 * @param low Least significant 64 bits
 * @throws common::NonConformantBinaryException version, variant, reserved bits,
 *         node id, type code or a BCD digit is wrong
 * @throws common::ChecksumMismatchException encoded number fails its check digit
 */
IdentityRecord decode(uint64_t high, uint64_t low);

IdentityRecord decode(const shared::util::Uuid& uuid);

/**
 * @brief True if decode(high, low) would succeed
 */
bool isConformant(uint64_t high, uint64_t low) noexcept;

bool isConformant(const shared::util::Uuid& uuid) noexcept;

} // namespace person::uuid
