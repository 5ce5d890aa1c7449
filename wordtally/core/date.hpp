/*******************************************************************************
 * wordtally/core/date.hpp
 *
 * Calendar date value type and the dd-MM-yyyy record date format.
 *
 * Part of Project Wordtally
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef WORDTALLY_CORE_DATE_HEADER
#define WORDTALLY_CORE_DATE_HEADER

#include <ostream>
#include <string>
#include <tuple>

namespace wordtally {
namespace core {

/*!
 * A proleptic Gregorian calendar date. Dates are plain values: they are parsed
 * once per record and compared with the usual relational operators, there is
 * no formatter state shared between threads.
 */
struct Date {
    int      year;
    unsigned month;
    unsigned day;

    bool operator == (const Date& b) const {
        return year == b.year && month == b.month && day == b.day;
    }
    bool operator != (const Date& b) const { return !(*this == b); }

    bool operator < (const Date& b) const {
        return std::tie(year, month, day) < std::tie(b.year, b.month, b.day);
    }
    bool operator > (const Date& b) const { return b < *this; }
    bool operator <= (const Date& b) const { return !(b < *this); }
    bool operator >= (const Date& b) const { return !(*this < b); }

    //! print as dd-MM-yyyy
    friend std::ostream& operator << (std::ostream& os, const Date& d);
};

//! true for leap years of the Gregorian calendar.
bool IsLeapYear(int year);

//! number of days in the given month (1..12) of year.
unsigned DaysInMonth(int year, unsigned month);

/*!
 * Parse a date in the fixed dd-MM-yyyy format: exactly two digits day, two
 * digits month and four digits year separated by '-', nothing before or after.
 *
 * Month must be 1..12, day 1..31 and year at least 1. A day which does not
 * exist in the month (31-04-2019) is moved back to the last day of the month.
 *
 * \return true if the text was a valid date, false otherwise (out untouched).
 */
bool ParseDate(const std::string& text, Date* out);

//! format a Date as dd-MM-yyyy
std::string FormatDate(const Date& d);

//! Records dated before this day are counted: 18-10-2019.
static constexpr Date kDefaultCutoff = { 2019, 10, 18 };

} // namespace core
} // namespace wordtally

#endif // !WORDTALLY_CORE_DATE_HEADER

/******************************************************************************/
