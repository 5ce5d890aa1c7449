/*******************************************************************************
 * wordtally/core/emitter.cpp
 *
 * Part of Project Wordtally
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <wordtally/core/emitter.hpp>

#include <string>
#include <utility>
#include <vector>

namespace wordtally {
namespace core {

std::vector<WordCountPair> ProcessLine(
    const std::string& line, const Date& cutoff) {
    std::vector<WordCountPair> pairs;
    ProcessLine(line, cutoff, [&pairs](WordCountPair&& p) {
                    pairs.emplace_back(std::move(p));
                });
    return pairs;
}

} // namespace core
} // namespace wordtally

/******************************************************************************/
