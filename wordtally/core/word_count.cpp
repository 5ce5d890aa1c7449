/*******************************************************************************
 * wordtally/core/word_count.cpp
 *
 * Part of Project Wordtally
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <wordtally/core/word_count.hpp>

#include <algorithm>
#include <string>
#include <vector>

namespace wordtally {
namespace core {

std::vector<WordCountPair> CombineWordCounts(
    const std::vector<WordCountPair>& batch) {

    WordCountPostTable table;
    for (const WordCountPair& p : batch)
        table.Insert(p);

    std::vector<WordCountPair> out;
    out.reserve(table.num_items());
    table.Flush([&out](const WordCountPair& p) { out.push_back(p); });
    return out;
}

WordCountPair ReduceWord(
    const std::string& word, const std::vector<size_t>& contributions) {
    WordCountReduce reduce;
    size_t sum = 0;
    for (const size_t& c : contributions)
        sum = reduce(sum, c);
    return WordCountPair(word, sum);
}

void SortWordCounts(std::vector<WordCountPair>* pairs) {
    std::sort(pairs->begin(), pairs->end(),
              [](const WordCountPair& a, const WordCountPair& b) {
                  return a.first < b.first;
              });
}

} // namespace core
} // namespace wordtally

/******************************************************************************/
