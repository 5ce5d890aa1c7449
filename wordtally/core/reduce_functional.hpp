/*******************************************************************************
 * wordtally/core/reduce_functional.hpp
 *
 * Index and reduce functions plugged into the reduce tables.
 *
 * Part of Project Wordtally
 *
 * Copyright (C) 2015 Matthias Stumpp <mstumpp@gmail.com>
 * Copyright (C) 2015 Alexander Noe <aleexnoe@gmail.com>
 * Copyright (C) 2015 Timo Bingmann <tb@panthema.net>
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef WORDTALLY_CORE_REDUCE_FUNCTIONAL_HEADER
#define WORDTALLY_CORE_REDUCE_FUNCTIONAL_HEADER

#include <wordtally/common/hash.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>

namespace wordtally {
namespace core {

/*!
 * A reduce index function which returns the partition of a key by hashing
 * it. All workers must use the same salt and hash function, such that equal
 * keys from all workers meet in the same partition.
 */
template <typename Key, typename HashFunction = std::hash<Key> >
class ReduceByHash
{
public:
    explicit ReduceByHash(
        const HashFunction& hash_function = HashFunction())
        : ReduceByHash(/* salt */ 0, hash_function) { }

    explicit ReduceByHash(
        const uint64_t& salt,
        const HashFunction& hash_function = HashFunction())
        : salt_(salt), hash_function_(hash_function) { }

    //! which partition number the key belongs to.
    size_t operator () (const Key& k, const size_t& num_partitions) const {
        uint64_t hash = common::Hash128to64(salt_, hash_function_(k));
        return static_cast<size_t>(hash % num_partitions);
    }

private:
    uint64_t salt_;
    HashFunction hash_function_;
};

//! The associative and commutative reduce function of all count tables.
template <typename Value>
class SumReduce
{
public:
    Value operator () (const Value& a, const Value& b) const {
        return a + b;
    }
};

} // namespace core
} // namespace wordtally

#endif // !WORDTALLY_CORE_REDUCE_FUNCTIONAL_HEADER

/******************************************************************************/
