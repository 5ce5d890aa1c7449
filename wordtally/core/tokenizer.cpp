/*******************************************************************************
 * wordtally/core/tokenizer.cpp
 *
 * Part of Project Wordtally
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <wordtally/core/tokenizer.hpp>

#include <unicode/locid.h>
#include <unicode/stringpiece.h>
#include <unicode/unistr.h>

#include <string>
#include <utility>
#include <vector>

namespace wordtally {
namespace core {

std::string LowerToken(const char* data, size_t size) {
    std::string out;

    // fast path for pure ASCII tokens
    bool ascii = true;
    for (size_t i = 0; i < size; ++i) {
        if (static_cast<unsigned char>(data[i]) >= 0x80) {
            ascii = false;
            break;
        }
    }

    if (ascii) {
        out.assign(data, size);
        for (char& c : out) {
            if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
        }
        return out;
    }

    icu::UnicodeString us = icu::UnicodeString::fromUTF8(
        icu::StringPiece(data, static_cast<int32_t>(size)));
    us.toLower(icu::Locale::getRoot());
    us.toUTF8String(out);
    return out;
}

std::vector<std::string> Tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    Tokenize(text, [&tokens](std::string&& token) {
                 tokens.emplace_back(std::move(token));
             });
    return tokens;
}

} // namespace core
} // namespace wordtally

/******************************************************************************/
