/*******************************************************************************
 * wordtally/core/record.hpp
 *
 * Parsing and filtering of one tab-separated input line.
 *
 * Part of Project Wordtally
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef WORDTALLY_CORE_RECORD_HEADER
#define WORDTALLY_CORE_RECORD_HEADER

#include <wordtally/core/date.hpp>

#include <ostream>
#include <string>
#include <vector>

namespace wordtally {
namespace core {

//! One input row: title, reply flag, date and comment, in this field order.
struct Record {
    std::string title;
    //! empty for replies, whose title field is not counted
    std::string reply_flag;
    std::string date_raw;
    std::string comment;
};

//! Outcome of parsing or processing one input line.
enum class RecordStatus {
    //! well-formed record, dated before the cutoff
    Ok,
    //! header or metadata line, dropped silently
    Header,
    //! less than four fields
    TooFewFields,
    //! the date field is not a dd-MM-yyyy date
    BadDate,
    //! well-formed record dated on or after the cutoff
    Excluded
};

//! true for TooFewFields and BadDate
static inline bool IsMalformed(RecordStatus s) {
    return s == RecordStatus::TooFewFields || s == RecordStatus::BadDate;
}

//! returns "ok", "header", "too_few_fields", "bad_date" or "excluded"
const char * RecordStatusName(RecordStatus s);

//! make RecordStatus ostreamable
std::ostream& operator << (std::ostream& os, const RecordStatus& s);

//! Minimum number of tab separated fields of a record.
static constexpr size_t kRecordFields = 4;

//! Heuristic header/metadata filter: the line contains both "post_theme" and
//! "date" anywhere.
bool IsHeaderLine(const std::string& line);

/*!
 * Split a line at each tab. Empty fields inside the line or at its front are
 * kept, empty fields at its end are dropped, hence "a\tb\t\t" has two fields.
 */
std::vector<std::string> SplitFields(const std::string& line);

/*!
 * Parse one input line into a Record and its date. Header lines are rejected
 * before the line is split; a trailing carriage return is ignored. The
 * record's fields beyond the fourth are ignored.
 *
 * \return RecordStatus::Ok if out and date were filled, or the reason why the
 * line was skipped. Never returns Excluded: comparing with the cutoff is done
 * by IsIncluded().
 */
RecordStatus ParseRecord(const std::string& line, Record* out, Date* date);

//! Inclusion rule: strictly before the cutoff.
static inline bool IsIncluded(const Date& date, const Date& cutoff) {
    return date < cutoff;
}

} // namespace core
} // namespace wordtally

#endif // !WORDTALLY_CORE_RECORD_HEADER

/******************************************************************************/
