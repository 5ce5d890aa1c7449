/*******************************************************************************
 * wordtally/core/emitter.hpp
 *
 * Turns one input line into its (word, 1) pairs.
 *
 * Part of Project Wordtally
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef WORDTALLY_CORE_EMITTER_HEADER
#define WORDTALLY_CORE_EMITTER_HEADER

#include <wordtally/core/date.hpp>
#include <wordtally/core/record.hpp>
#include <wordtally/core/tokenizer.hpp>

#include <string>
#include <utility>
#include <vector>

namespace wordtally {
namespace core {

using WordCountPair = std::pair<std::string, size_t>;

/*!
 * Emit a (token, 1) pair for each token of the comment, followed by those of
 * the title if the record's reply flag is non-empty. Replies carry an empty
 * reply flag and their title field is never counted.
 *
 * \param emit functor taking WordCountPair&&
 */
template <typename Emit>
void EmitWords(const Record& record, Emit&& emit) {
    Tokenize(record.comment, [&emit](std::string&& token) {
                 emit(WordCountPair(std::move(token), 1));
             });

    if (!record.reply_flag.empty()) {
        Tokenize(record.title, [&emit](std::string&& token) {
                     emit(WordCountPair(std::move(token), 1));
                 });
    }
}

/*!
 * The per-record map function: parse the line, drop it unless it is a
 * well-formed record dated before cutoff, and emit its word pairs. The function
 * has no state, it may be called concurrently and repeatedly on the same line.
 *
 * \return Ok if pairs were emitted, otherwise the reason the line was dropped.
 */
template <typename Emit>
RecordStatus ProcessLine(
    const std::string& line, const Date& cutoff, Emit&& emit) {

    Record record;
    Date date;
    RecordStatus status = ParseRecord(line, &record, &date);
    if (status != RecordStatus::Ok)
        return status;

    if (!IsIncluded(date, cutoff))
        return RecordStatus::Excluded;

    EmitWords(record, emit);
    return RecordStatus::Ok;
}

//! Returns the word pairs of a single line, empty if the line is dropped.
std::vector<WordCountPair> ProcessLine(
    const std::string& line, const Date& cutoff = kDefaultCutoff);

} // namespace core
} // namespace wordtally

#endif // !WORDTALLY_CORE_EMITTER_HEADER

/******************************************************************************/
