/*******************************************************************************
 * wordtally/common/hash.hpp
 *
 * Part of Project Wordtally
 *
 * Copyright (C) 2015 Timo Bingmann <tb@panthema.net>
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef WORDTALLY_COMMON_HASH_HEADER
#define WORDTALLY_COMMON_HASH_HEADER

#include <cstdint>

namespace wordtally {
namespace common {

//! This is the Hash128to64 function from Google's cityhash (available under the
//! MIT License).
static inline uint64_t Hash128to64(const uint64_t upper, const uint64_t lower) {
    // Murmur-inspired hashing.
    const uint64_t k = 0x9DDFEA08EB382D69ull;
    uint64_t a = (lower ^ upper) * k;
    a ^= (a >> 47);
    uint64_t b = (upper ^ a) * k;
    b ^= (b >> 47);
    b *= k;
    return b;
}

} // namespace common
} // namespace wordtally

#endif // !WORDTALLY_COMMON_HASH_HEADER

/******************************************************************************/
