/*******************************************************************************
 * wordtally/core/date.cpp
 *
 * Part of Project Wordtally
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <wordtally/core/date.hpp>

#include <iomanip>
#include <sstream>
#include <string>

namespace wordtally {
namespace core {

bool IsLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned DaysInMonth(int year, unsigned month) {
    static const unsigned days[12] = {
        31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31
    };
    if (month == 2 && IsLeapYear(year)) return 29;
    return days[month - 1];
}

//! parse exactly n ASCII digits at pos, no sign and no whitespace.
static inline
bool ParseDigits(const std::string& text, size_t pos, size_t n, int* out) {
    int value = 0;
    for (size_t i = pos; i < pos + n; ++i) {
        if (text[i] < '0' || text[i] > '9') return false;
        value = value * 10 + (text[i] - '0');
    }
    *out = value;
    return true;
}

bool ParseDate(const std::string& text, Date* out) {
    // dd-MM-yyyy
    if (text.size() != 10 || text[2] != '-' || text[5] != '-')
        return false;

    int day, month, year;
    if (!ParseDigits(text, 0, 2, &day) ||
        !ParseDigits(text, 3, 2, &month) ||
        !ParseDigits(text, 6, 4, &year))
        return false;

    if (month < 1 || month > 12 || day < 1 || day > 31 || year < 1)
        return false;

    Date d;
    d.year = year;
    d.month = static_cast<unsigned>(month);
    d.day = static_cast<unsigned>(day);

    // resolve 29..31 to the last day of shorter months
    unsigned last = DaysInMonth(d.year, d.month);
    if (d.day > last) d.day = last;

    *out = d;
    return true;
}

std::string FormatDate(const Date& d) {
    std::ostringstream oss;
    oss << d;
    return oss.str();
}

std::ostream& operator << (std::ostream& os, const Date& d) {
    std::ios::fmtflags flags(os.flags());
    char fill = os.fill('0');
    os << std::setw(2) << d.day << '-'
       << std::setw(2) << d.month << '-'
       << std::setw(4) << d.year;
    os.fill(fill);
    os.flags(flags);
    return os;
}

} // namespace core
} // namespace wordtally

/******************************************************************************/
