/*******************************************************************************
 * wordtally/core/tokenizer.hpp
 *
 * Splits UTF-8 text into lowercase word tokens.
 *
 * Part of Project Wordtally
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef WORDTALLY_CORE_TOKENIZER_HEADER
#define WORDTALLY_CORE_TOKENIZER_HEADER

#include <unicode/uchar.h>
#include <unicode/umachine.h>
#include <unicode/utf8.h>

#include <cstdint>
#include <string>
#include <vector>

namespace wordtally {
namespace core {

/*!
 * Characters which make up tokens: Unicode letters (general category L),
 * the ASCII digits 0-9 and the plus sign '+'. Any other code point separates
 * tokens.
 */
static inline bool IsTokenChar(UChar32 c) {
    if (c < 0x80) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
               (c >= '0' && c <= '9') || c == '+';
    }
    return u_isalpha(c) != 0;
}

//! Lowercase a UTF-8 token using full Unicode case mapping (root locale).
std::string LowerToken(const char* data, size_t size);

/*!
 * Split text into maximal runs of token characters and call the callback with
 * each run, lowercased, as std::string. Runs are never empty. Invalid UTF-8
 * byte sequences act as separators.
 *
 * \param text      UTF-8 text to split
 * \param callback  functor taking std::string&& token
 */
template <typename Callback>
void Tokenize(const std::string& text, Callback&& callback) {
    const uint8_t* s = reinterpret_cast<const uint8_t*>(text.data());
    const int32_t length = static_cast<int32_t>(text.size());

    int32_t i = 0, token_begin = -1;
    while (i < length)
    {
        int32_t char_begin = i;
        UChar32 c;
        U8_NEXT(s, i, length, c);

        if (c >= 0 && IsTokenChar(c)) {
            if (token_begin < 0) token_begin = char_begin;
        }
        else if (token_begin >= 0) {
            callback(LowerToken(text.data() + token_begin,
                                char_begin - token_begin));
            token_begin = -1;
        }
    }
    if (token_begin >= 0) {
        callback(LowerToken(text.data() + token_begin,
                            length - token_begin));
    }
}

//! Split text into lowercase tokens and return them in order.
std::vector<std::string> Tokenize(const std::string& text);

} // namespace core
} // namespace wordtally

#endif // !WORDTALLY_CORE_TOKENIZER_HEADER

/******************************************************************************/
