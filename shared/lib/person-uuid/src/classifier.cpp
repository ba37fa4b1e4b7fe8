/**
 * @file classifier.cpp
 * @brief Identity type classification implementation
 */

#include "person/uuid/classifier.h"
#include "person/uuid/calendar.h"
#include "exception/exceptions.h"
#include <spdlog/spdlog.h>

namespace person::uuid {

namespace {

constexpr uint64_t GDNR_PREFIX = 302;
constexpr int SAMNR_DAY_OFFSET = 60;

std::string dateString(const DateParts& date, int day) {
    return std::to_string(date.year) + "-" + std::to_string(date.month) + "-" + std::to_string(day);
}

} // namespace

DateParts dateParts(uint64_t number) {
    DateParts date;
    date.year = static_cast<int>(number / 100000000ULL);
    date.month = static_cast<int>((number / 1000000ULL) % 100);
    date.day = static_cast<int>((number / 10000ULL) % 100);
    return date;
}

IdType classify(uint64_t number) {
    if (number > MAX_NUMBER) {
        throw common::MalformedNumberException(std::to_string(number) + " has more than 12 digits");
    }

    if (number / 10000000ULL == GDNR_PREFIX) {
        return IdType::GDNR;
    }

    DateParts date = dateParts(number);
    int century = date.year / 100;

    if ((century == 0 || century == 16) && date.month >= 20) {
        return IdType::ORGNR;
    }

    bool calendarMonth = date.month >= 1 && date.month <= 12;

    if (century >= 18 && calendarMonth && date.day >= 1 && date.day <= 31) {
        if (!isValidDate(date.year, date.month, date.day)) {
            spdlog::debug("Rejected personal number {}: no such date", number);
            throw common::InvalidDateException(
                "identity " + std::to_string(number) + ": " + dateString(date, date.day));
        }
        return IdType::PERSNR;
    }

    if (calendarMonth && date.day >= 61 && date.day <= 91) {
        int realDay = date.day - SAMNR_DAY_OFFSET;
        if (!isValidDate(date.year, date.month, realDay)) {
            spdlog::debug("Rejected coordination number {}: no such date", number);
            throw common::InvalidDateException(
                "identity " + std::to_string(number) + ": " + dateString(date, realDay));
        }
        return IdType::SAMNR;
    }

    spdlog::debug("Number {} matches no identity category", number);
    throw common::UnclassifiableNumberException(std::to_string(number));
}

std::optional<IdType> tryClassify(uint64_t number) {
    try {
        return classify(number);
    } catch (const common::PersonUuidException&) {
        return std::nullopt;
    }
}

} // namespace person::uuid
