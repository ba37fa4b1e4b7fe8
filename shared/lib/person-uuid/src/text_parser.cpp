/**
 * @file text_parser.cpp
 * @brief Identity text parsing implementation
 */

#include "person/uuid/text_parser.h"
#include "person/uuid/binary_codec.h"
#include "exception/exceptions.h"
#include <spdlog/spdlog.h>

namespace person::uuid {

namespace {

bool allDigits(const std::string& text, size_t begin, size_t end) {
    for (size_t i = begin; i < end; i++) {
        if (text[i] < '0' || text[i] > '9') {
            return false;
        }
    }
    return true;
}

uint64_t digitValue(const std::string& text, size_t begin, size_t end) {
    uint64_t value = 0;
    for (size_t i = begin; i < end; i++) {
        value = value * 10 + static_cast<uint64_t>(text[i] - '0');
    }
    return value;
}

} // namespace

std::optional<uint64_t> parseNumberText(const std::string& text) {
    size_t len = text.length();

    // DDDDDDDDDD or DDDDDDDDDDDD
    if ((len == 10 || len == 12) && allDigits(text, 0, len)) {
        return digitValue(text, 0, len);
    }

    // DDDDDD-DDDD or DDDDDDDD-DDDD
    if ((len == 11 || len == 13) && text[len - 5] == '-' &&
        allDigits(text, 0, len - 5) && allDigits(text, len - 4, len)) {
        return digitValue(text, 0, len - 5) * 10000 + digitValue(text, len - 4, len);
    }

    return std::nullopt;
}

IdentityRecord parse(const std::string& text) {
    if (auto uuid = shared::util::UuidUtil::parse(text)) {
        return decode(*uuid);
    }

    if (auto number = parseNumberText(text)) {
        return IdentityRecord(*number);
    }

    spdlog::debug("Unparsable identity text ({} chars)", text.length());
    throw common::UnparsableTextException("'" + text + "' is neither an identity number nor a person UUID");
}

std::optional<IdentityRecord> tryParse(const std::string& text) {
    try {
        return parse(text);
    } catch (const common::PersonUuidException& e) {
        spdlog::debug("tryParse: {}", e.what());
        return std::nullopt;
    }
}

} // namespace person::uuid
