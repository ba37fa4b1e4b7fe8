/**
 * @file calendar.h
 * @brief Gregorian date validation for embedded birth dates
 */

#pragma once

namespace person::uuid {

/**
 * @brief Check if year is a Gregorian leap year
 */
bool isLeapYear(int year);

/**
 * @brief Get number of days in month
 * @return 28..31, or 0 when month is outside 1..12
 */
int daysInMonth(int year, int month);

/**
 * @brief Check that (year, month, day) is a real Gregorian date
 */
bool isValidDate(int year, int month, int day);

} // namespace person::uuid
