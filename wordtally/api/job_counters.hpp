/*******************************************************************************
 * wordtally/api/job_counters.hpp
 *
 * Part of Project Wordtally
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef WORDTALLY_API_JOB_COUNTERS_HEADER
#define WORDTALLY_API_JOB_COUNTERS_HEADER

#include <wordtally/core/record.hpp>

#include <cstddef>
#include <ostream>

namespace wordtally {
namespace api {

/*!
 * Record and pair counters of a word count run. Each worker owns one set,
 * which are summed after the run.
 */
struct JobCounters {
    //! lines read from the input
    size_t input_lines = 0;
    //! lines recognized as a header and skipped
    size_t header_lines = 0;
    //! lines with fewer than four fields
    size_t too_few_fields = 0;
    //! lines with a date field that does not parse
    size_t bad_dates = 0;
    //! well-formed records dated on or after the cutoff
    size_t excluded_records = 0;
    //! records whose words were emitted
    size_t accepted_records = 0;
    //! (word,1) pairs emitted by the map phase
    size_t map_output_words = 0;
    //! partial sums emitted by the combiners
    size_t combine_output_records = 0;
    //! pairs received by the reducers
    size_t reduce_input_records = 0;
    //! distinct words in the result
    size_t reduce_output_records = 0;

    size_t malformed_records() const { return too_few_fields + bad_dates; }

    //! count a record by its status
    void Count(core::RecordStatus status) {
        ++input_lines;
        switch (status) {
        case core::RecordStatus::Ok:
            ++accepted_records;
            break;
        case core::RecordStatus::Header:
            ++header_lines;
            break;
        case core::RecordStatus::TooFewFields:
            ++too_few_fields;
            break;
        case core::RecordStatus::BadDate:
            ++bad_dates;
            break;
        case core::RecordStatus::Excluded:
            ++excluded_records;
            break;
        }
    }

    JobCounters& operator += (const JobCounters& b) {
        input_lines += b.input_lines;
        header_lines += b.header_lines;
        too_few_fields += b.too_few_fields;
        bad_dates += b.bad_dates;
        excluded_records += b.excluded_records;
        accepted_records += b.accepted_records;
        map_output_words += b.map_output_words;
        combine_output_records += b.combine_output_records;
        reduce_input_records += b.reduce_input_records;
        reduce_output_records += b.reduce_output_records;
        return *this;
    }

    friend std::ostream& operator << (std::ostream& os, const JobCounters& c) {
        return os << "input_lines=" << c.input_lines
                  << " header_lines=" << c.header_lines
                  << " malformed_records=" << c.malformed_records()
                  << " too_few_fields=" << c.too_few_fields
                  << " bad_dates=" << c.bad_dates
                  << " excluded_records=" << c.excluded_records
                  << " accepted_records=" << c.accepted_records
                  << " map_output_words=" << c.map_output_words
                  << " combine_output_records=" << c.combine_output_records
                  << " reduce_input_records=" << c.reduce_input_records
                  << " reduce_output_records=" << c.reduce_output_records;
    }
};

} // namespace api
} // namespace wordtally

#endif // !WORDTALLY_API_JOB_COUNTERS_HEADER

/******************************************************************************/
