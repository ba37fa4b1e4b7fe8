/**
 * @file json_codec.h
 * @brief JSON representation of identity records
 *
 * Output shape:
 * {
 *   "number": "194106177753", "formatted": "19410617-7753",
 *   "serial": 99, "type": "PERSNR", "typeCode": 1,
 *   "uuid": "19410617-7753-1099-9001-d59a20d06c1a"
 * }
 */

#pragma once

#include <json/json.h>
#include "identity.h"

namespace person::uuid {

/**
 * @brief Convert a record to JSON
 */
Json::Value toJson(const IdentityRecord& record);

/**
 * @brief Build a record from JSON
 *
 * Uses "uuid" when present (strict decode); a "serial" given alongside it
 * must match the serial carried in the UUID. Otherwise "number" as a digit
 * string in any accepted text form or as an unsigned integer, with an
 * optional "serial".
 *
 * @throws common::UnparsableTextException missing or ill-typed members
 * @throws common::MalformedNumberException negative or oversized numeric members
 * @throws common::PersonUuidException subclasses for validation failures
 */
IdentityRecord fromJson(const Json::Value& json);

} // namespace person::uuid
