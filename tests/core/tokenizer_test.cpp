/*******************************************************************************
 * tests/core/tokenizer_test.cpp
 *
 * Part of Project Wordtally
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <wordtally/core/tokenizer.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace wordtally;

using Tokens = std::vector<std::string>;

TEST(Tokenizer, Ascii) {
    ASSERT_EQ(Tokens({ "hello", "world" }), core::Tokenize("Hello World"));
    ASSERT_EQ(Tokens({ "foo", "bar" }), core::Tokenize("  foo,,bar!! "));
    ASSERT_EQ(Tokens({ "c++", "is", "2x" }), core::Tokenize("C++ is 2x"));
    ASSERT_EQ(Tokens({ "don", "t" }), core::Tokenize("don't"));
    ASSERT_EQ(Tokens({ "a", "b", "c" }), core::Tokenize("a_b-c"));
    ASSERT_EQ(Tokens({ "1+1", "2" }), core::Tokenize("1+1=2"));
    ASSERT_EQ(Tokens(), core::Tokenize(""));
    ASSERT_EQ(Tokens(), core::Tokenize(" \t.,;:!?()"));
}

TEST(Tokenizer, Unicode) {
    ASSERT_EQ(Tokens({ "привет", "мир" }), core::Tokenize("Привет, МИР!"));
    ASSERT_EQ(Tokens({ "über", "straße" }), core::Tokenize("ÜBER Straße"));
    ASSERT_EQ(Tokens({ "日本語" }), core::Tokenize("日本語"));
    // non-ASCII digits are separators
    ASSERT_EQ(Tokens({ "a", "b" }), core::Tokenize("a\xd9\xa3" "b"));
    // invalid UTF-8 separates tokens
    ASSERT_EQ(Tokens({ "ab", "cd" }), core::Tokenize("ab\xff" "cd"));
}

TEST(Tokenizer, Properties) {
    const std::vector<std::string> inputs = {
        "Hello World", "C++ and c++", "--==--", "Ünïcödé tëxt, ÆØÅ!",
        "tab\tseparated\tfields", "x1 y22 z333", "émoji 😀 between",
        "Ελληνικά κείμενα", "mixed+plus+signs", "a\xff\xfe" "b"
    };

    for (const std::string& in : inputs) {
        for (const std::string& token : core::Tokenize(in)) {
            // never empty
            ASSERT_FALSE(token.empty());
            // a token is a fixed point
            ASSERT_EQ(Tokens({ token }), core::Tokenize(token)) << in;
            // and contains no separators
            for (const char& c : token) {
                ASSERT_NE(' ', c);
                ASSERT_NE('\t', c);
                ASSERT_NE(',', c);
                ASSERT_NE('-', c);
            }
        }
    }
}

TEST(Tokenizer, Callback) {
    size_t count = 0;
    core::Tokenize("one two three", [&count](std::string&& token) {
                       ASSERT_FALSE(token.empty());
                       ++count;
                   });
    ASSERT_EQ(3u, count);
}

/******************************************************************************/
