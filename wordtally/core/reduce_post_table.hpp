/*******************************************************************************
 * wordtally/core/reduce_post_table.hpp
 *
 * Hash table which reduces all partial results of a key to the final one.
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
#ifndef WORDTALLY_CORE_REDUCE_POST_TABLE_HEADER
#define WORDTALLY_CORE_REDUCE_POST_TABLE_HEADER

#include <wordtally/common/logger.hpp>

#include <functional>
#include <unordered_map>
#include <utility>

namespace wordtally {
namespace core {

/*!
 * The post-phase table receives all items of one partition, which were
 * possibly pre-reduced by any number of ReducePreTable flushes on any number
 * of workers, in arbitrary order. Since the reduce function is associative and
 * commutative, the final value of a key does not depend on that order.
 *
 * Items may only be flushed once all inputs of the partition were inserted.
 */
template <typename Key, typename Value, typename ReduceFunction,
          typename KeyEqualFunction = std::equal_to<Key> >
class ReducePostTable
{
    static constexpr bool debug = false;

public:
    using KeyValuePair = std::pair<Key, Value>;

    explicit ReducePostTable(
        const ReduceFunction& reduce_function = ReduceFunction())
        : reduce_function_(reduce_function) { }

    //! non-copyable: delete copy-constructor
    ReducePostTable(const ReducePostTable&) = delete;
    //! non-copyable: delete assignment operator
    ReducePostTable& operator = (const ReducePostTable&) = delete;

    //! Insert a partial or unit result. Returns true if the key is new.
    bool Insert(const KeyValuePair& kv) {
        ++num_inserted_;

        auto it = table_.find(kv.first);
        if (it != table_.end()) {
            it->second = reduce_function_(it->second, kv.second);
            return false;
        }
        table_.emplace(kv);
        return true;
    }

    /*!
     * Emit one final pair per key and clear the table.
     *
     * \param emit functor taking const KeyValuePair&
     */
    template <typename Emit>
    void Flush(Emit&& emit) {
        sLOG << "ReducePostTable: flushing" << table_.size() << "items from"
             << num_inserted_ << "inputs";

        for (const KeyValuePair& kv : table_)
            emit(kv);

        Table().swap(table_);
    }

    //! Returns the number of distinct keys in the table.
    size_t num_items() const { return table_.size(); }

    //! Returns the number of items inserted so far.
    size_t num_inserted() const { return num_inserted_; }

private:
    using Table = std::unordered_map<
              Key, Value, std::hash<Key>, KeyEqualFunction>;

    //! associative reduce function
    ReduceFunction reduce_function_;

    //! key -> reduced value
    Table table_;

    //! number of items inserted
    size_t num_inserted_ = 0;
};

} // namespace core
} // namespace wordtally

#endif // !WORDTALLY_CORE_REDUCE_POST_TABLE_HEADER

/******************************************************************************/
