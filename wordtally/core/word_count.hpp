/*******************************************************************************
 * wordtally/core/word_count.hpp
 *
 * The two aggregation steps of the word count on plain vectors.
 *
 * Part of Project Wordtally
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef WORDTALLY_CORE_WORD_COUNT_HEADER
#define WORDTALLY_CORE_WORD_COUNT_HEADER

#include <wordtally/core/emitter.hpp>
#include <wordtally/core/reduce_functional.hpp>
#include <wordtally/core/reduce_post_table.hpp>

#include <string>
#include <vector>

namespace wordtally {
namespace core {

//! count reduction used by all tables of the word count.
using WordCountReduce = SumReduce<size_t>;

//! final aggregation table of one partition.
using WordCountPostTable =
          ReducePostTable<std::string, size_t, WordCountReduce>;

/*!
 * Combiner: reduce a batch of word pairs to one pair per distinct word whose
 * count is the sum of the batch's counts for it. The result is in no
 * particular order. May be applied to any sub-batch any number of times.
 */
std::vector<WordCountPair> CombineWordCounts(
    const std::vector<WordCountPair>& batch);

/*!
 * Reducer: sum all unit or partial counts of one word, in whatever order and
 * from whatever number of combiner passes they came.
 */
WordCountPair ReduceWord(
    const std::string& word, const std::vector<size_t>& contributions);

//! Order word pairs by word, bytewise ascending. Counts break no ties since
//! reduced words are unique.
void SortWordCounts(std::vector<WordCountPair>* pairs);

} // namespace core
} // namespace wordtally

#endif // !WORDTALLY_CORE_WORD_COUNT_HEADER

/******************************************************************************/
