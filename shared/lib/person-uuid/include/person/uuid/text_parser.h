/**
 * @file text_parser.h
 * @brief Parse identity numbers and person UUID text
 *
 * Accepted shapes:
 *   - xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx  person UUID, decoded strictly
 *   - DDDDDDDDDD / DDDDDDDDDDDD             10 or 12 digits
 *   - DDDDDD-DDDD / DDDDDDDD-DDDD           hyphenated forms
 */

#pragma once

#include <optional>
#include <string>
#include "identity.h"

namespace person::uuid {

/**
 * @brief Parse text into an identity record
 *
 * Identity number forms go through full construction (type derivation,
 * check digit, date). UUID text goes through the binary decoder.
 *
 * @throws common::UnparsableTextException text matches no accepted shape
 * @throws common::PersonUuidException subclasses for validation failures
 */
IdentityRecord parse(const std::string& text);

/**
 * @brief Non-throwing parse
 * @return Record, or std::nullopt on any parse or validation failure
 */
std::optional<IdentityRecord> tryParse(const std::string& text);

/**
 * @brief Extract the raw number from an identity number form
 *
 * @return Number, or std::nullopt if text is not one of the digit shapes
 */
std::optional<uint64_t> parseNumberText(const std::string& text);

} // namespace person::uuid
