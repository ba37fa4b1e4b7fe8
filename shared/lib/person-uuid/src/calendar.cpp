/**
 * @file calendar.cpp
 * @brief Gregorian calendar helpers
 */

#include "person/uuid/calendar.h"

namespace person::uuid {

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

int daysInMonth(int year, int month) {
    switch (month) {
        case 2:
            return isLeapYear(year) ? 29 : 28;
        case 4: case 6: case 9: case 11:
            return 30;
        case 1: case 3: case 5: case 7: case 8: case 10: case 12:
            return 31;
        default:
            return 0;
    }
}

bool isValidDate(int year, int month, int day) {
    if (day < 1 || month < 1 || month > 12) {
        return false;
    }
    return day <= daysInMonth(year, month);
}

} // namespace person::uuid
