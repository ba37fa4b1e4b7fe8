/**
 * @file json_codec.cpp
 * @brief JSON conversion for identity records
 */

#include "person/uuid/json_codec.h"
#include "person/uuid/binary_codec.h"
#include "person/uuid/text_parser.h"
#include "exception/exceptions.h"
#include <spdlog/spdlog.h>
#include <optional>
#include <string>

namespace person::uuid {

namespace {

std::string valueText(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

// Numeric values outside 0..UINT_MAX are malformed, anything else is unparsable
unsigned readSerial(const Json::Value& value) {
    if (!value.isNumeric()) {
        throw common::UnparsableTextException("\"serial\" must be an unsigned integer");
    }
    if (!value.isUInt()) {
        throw common::MalformedNumberException("\"serial\" out of range: " + valueText(value));
    }
    return value.asUInt();
}

} // namespace

Json::Value toJson(const IdentityRecord& record) {
    Json::Value result;
    result["number"] = std::to_string(record.getNumber());
    result["formatted"] = record.formatNumber();
    result["serial"] = record.getSerial();
    result["type"] = idTypeToString(record.getType());
    result["typeCode"] = idTypeCode(record.getType());
    result["uuid"] = record.toString();
    return result;
}

IdentityRecord fromJson(const Json::Value& json) {
    if (!json.isObject()) {
        throw common::UnparsableTextException("JSON identity must be an object");
    }

    std::optional<unsigned> serial;
    if (json.isMember("serial")) {
        serial = readSerial(json["serial"]);
    }

    if (json.isMember("uuid")) {
        const Json::Value& uuidValue = json["uuid"];
        if (!uuidValue.isString()) {
            throw common::UnparsableTextException("\"uuid\" must be a string");
        }
        auto uuid = shared::util::UuidUtil::parse(uuidValue.asString());
        if (!uuid) {
            throw common::UnparsableTextException("\"uuid\" is not a UUID: " + uuidValue.asString());
        }
        IdentityRecord record = decode(*uuid);
        if (serial && *serial != record.getSerial()) {
            spdlog::debug("JSON serial {} contradicts uuid serial {}", *serial, record.getSerial());
            throw common::UnparsableTextException(
                "\"serial\" " + std::to_string(*serial) + " disagrees with \"uuid\" " + uuidValue.asString());
        }
        return record;
    }

    if (!json.isMember("number")) {
        throw common::UnparsableTextException("JSON identity needs \"uuid\" or \"number\"");
    }

    const Json::Value& numberValue = json["number"];
    uint64_t number = 0;
    if (numberValue.isString()) {
        auto parsed = parseNumberText(numberValue.asString());
        if (!parsed) {
            throw common::UnparsableTextException("\"number\" is not an identity number: " + numberValue.asString());
        }
        number = *parsed;
    } else if (numberValue.isNumeric()) {
        if (!numberValue.isUInt64()) {
            throw common::MalformedNumberException("\"number\" out of range: " + valueText(numberValue));
        }
        number = numberValue.asUInt64();
    } else {
        throw common::UnparsableTextException("\"number\" must be a string or unsigned integer");
    }

    spdlog::debug("Identity from JSON: number={}, serial={}", number, serial.value_or(0));
    return IdentityRecord(number, serial.value_or(0));
}

} // namespace person::uuid
