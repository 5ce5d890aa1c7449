/*******************************************************************************
 * wordtally/api/word_count.hpp
 *
 * The word count job: reads dated posts, counts the words of posts dated
 * before a cutoff and returns the totals sorted by word.
 *
 * Part of Project Wordtally
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef WORDTALLY_API_WORD_COUNT_HEADER
#define WORDTALLY_API_WORD_COUNT_HEADER

#include <wordtally/api/config.hpp>
#include <wordtally/api/job_counters.hpp>
#include <wordtally/core/emitter.hpp>

#include <string>
#include <vector>

namespace wordtally {
namespace api {

using core::WordCountPair;

struct WordCountResult {
    //! one pair per distinct word, sorted by word bytewise
    std::vector<WordCountPair> pairs;
    //! counters summed over all workers
    JobCounters counters;
};

/*!
 * Run the word count over the given input paths (files, directories or glob
 * patterns) with config.num_workers threads.
 *
 * The input bytes are split evenly among the workers. Each worker maps its
 * lines to (word,1) pairs, optionally combines them, and routes them to the
 * worker owning the word's hash partition, which sums them up. The result
 * does not depend on the number of workers or the combiner settings.
 *
 * Throws ConfigException for an invalid config, and SystemException or
 * ErrnoException if the input cannot be read. The first exception raised by a
 * worker is rethrown after all workers of the phase finished.
 */
WordCountResult RunWordCount(
    const JobConfig& config, const std::vector<std::string>& input_paths);

//! Run the word count and write the result to output_path.
WordCountResult RunWordCount(
    const JobConfig& config, const std::vector<std::string>& input_paths,
    const std::string& output_path);

//! Write pairs as "word<TAB>count" lines. Throws ErrnoException on failure.
void WriteWordCounts(
    const std::string& output_path, const std::vector<WordCountPair>& pairs);

} // namespace api
} // namespace wordtally

#endif // !WORDTALLY_API_WORD_COUNT_HEADER

/******************************************************************************/
