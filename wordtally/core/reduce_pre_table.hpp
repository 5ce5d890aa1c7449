/*******************************************************************************
 * wordtally/core/reduce_pre_table.hpp
 *
 * Partitioned hash table which pre-reduces items locally (the combiner).
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
#ifndef WORDTALLY_CORE_REDUCE_PRE_TABLE_HEADER
#define WORDTALLY_CORE_REDUCE_PRE_TABLE_HEADER

#include <wordtally/common/logger.hpp>
#include <wordtally/core/reduce_functional.hpp>

#include <cassert>
#include <functional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace wordtally {
namespace core {

/*!
 * Emitter implementation to plug into a ReducePreTable for collecting flushed
 * items into one output vector per partition. The vectors are owned by the
 * caller; this object only appends to them.
 */
template <typename KeyValuePair>
class ReducePreVectorEmitter
{
    static constexpr bool debug = false;

public:
    explicit ReducePreVectorEmitter(
        std::vector<std::vector<KeyValuePair> >& outputs)
        : outputs_(outputs),
          stats_(outputs.size(), 0) { }

    //! output an element into a partition
    void Emit(const size_t& partition_id, const KeyValuePair& p) {
        assert(partition_id < outputs_.size());
        stats_[partition_id]++;
        outputs_[partition_id].push_back(p);
    }

    //! number of items pushed into partition_id
    size_t emitted(size_t partition_id) const { return stats_[partition_id]; }

    void PrintStats() const {
        sLOG << "emit stats:";
        for (size_t i = 0; i < stats_.size(); ++i)
            sLOG << "emitter" << i << "pushed" << stats_[i];
    }

private:
    //! Set of output vectors, one per partition.
    std::vector<std::vector<KeyValuePair> >& outputs_;

    //! Emitter stats.
    std::vector<size_t> stats_;
};

/*!
 * A data structure which takes (key, value) pairs, assigns them to one of
 * num_partitions partitions by the IndexFunction and reduces pairs with equal
 * keys using the ReduceFunction.
 *
 * Each partition is limited to limit_items_per_partition distinct keys. If an
 * Insert() creates a key beyond the limit, the whole partition is flushed into
 * the Emitter and cleared. Hence the same key may be emitted several times with
 * partial results, which is fine as long as the ReduceFunction is associative
 * and commutative: the post-phase must reduce all emitted items again.
 *
 * The Emitter must provide `Emit(size_t partition_id, const KeyValuePair&)`.
 *
 * The table is owned by exactly one worker thread, it has no locking.
 */
template <typename Key, typename Value,
          typename ReduceFunction, typename Emitter,
          typename IndexFunction = ReduceByHash<Key>,
          typename KeyEqualFunction = std::equal_to<Key> >
class ReducePreTable
{
    static constexpr bool debug = false;

public:
    using KeyValuePair = std::pair<Key, Value>;
    using Partition = std::unordered_map<
              Key, Value, std::hash<Key>, KeyEqualFunction>;

    ReducePreTable(
        size_t num_partitions,
        const ReduceFunction& reduce_function,
        Emitter& emitter,
        size_t limit_items_per_partition,
        const IndexFunction& index_function = IndexFunction())
        : reduce_function_(reduce_function),
          emitter_(emitter),
          index_function_(index_function),
          limit_items_per_partition_(limit_items_per_partition),
          partitions_(num_partitions) {
        assert(num_partitions > 0);
        assert(limit_items_per_partition > 0);

        sLOG << "creating ReducePreTable with" << num_partitions
             << "partitions and limit" << limit_items_per_partition;
    }

    //! non-copyable: delete copy-constructor
    ReducePreTable(const ReducePreTable&) = delete;
    //! non-copyable: delete assignment operator
    ReducePreTable& operator = (const ReducePreTable&) = delete;

    /*!
     * Inserts a value into the table, reducing it in case a pair with the
     * same key is already in its partition. May flush the partition if its
     * item limit is exceeded.
     *
     * \return true if a new key was inserted to the table
     */
    bool Insert(const KeyValuePair& kv) {
        size_t partition_id = index_function_(kv.first, partitions_.size());
        assert(partition_id < partitions_.size());

        Partition& partition = partitions_[partition_id];

        auto it = partition.find(kv.first);
        if (it != partition.end()) {
            it->second = reduce_function_(it->second, kv.second);
            return false;
        }

        partition.emplace(kv);
        ++num_items_;

        if (partition.size() > limit_items_per_partition_)
            FlushPartition(partition_id);

        return true;
    }

    //! Emit all items of a partition and clear it.
    void FlushPartition(size_t partition_id) {
        assert(partition_id < partitions_.size());
        Partition& partition = partitions_[partition_id];

        sLOG << "ReducePreTable: flushing partition" << partition_id
             << "with" << partition.size() << "items";

        for (const KeyValuePair& kv : partition)
            emitter_.Emit(partition_id, kv);

        num_items_ -= partition.size();
        num_emitted_ += partition.size();
        ++num_flushes_;

        Partition().swap(partition);
    }

    //! Flush all partitions
    void FlushAll() {
        for (size_t id = 0; id < partitions_.size(); ++id)
            FlushPartition(id);
    }

    //! \name Accessors
    //! \{

    //! Returns the total number of items currently in the table.
    size_t num_items() const { return num_items_; }

    //! Returns the number of items currently in a partition.
    size_t num_items_in_partition(size_t partition_id) const {
        return partitions_[partition_id].size();
    }

    //! Returns the number of partitions
    size_t num_partitions() const { return partitions_.size(); }

    //! Returns the total number of items flushed into the emitter
    size_t num_emitted() const { return num_emitted_; }

    //! Returns the number of partition flushes so far
    size_t num_flushes() const { return num_flushes_; }

    //! Returns limit_items_per_partition_
    size_t limit_items_per_partition() const
    { return limit_items_per_partition_; }

    //! \}

private:
    //! associative reduce function
    ReduceFunction reduce_function_;

    //! flushed items are emitted here
    Emitter& emitter_;

    //! maps a key to its partition
    IndexFunction index_function_;

    //! flush a partition when it holds more than this many keys
    size_t limit_items_per_partition_;

    //! one hash map per output partition
    std::vector<Partition> partitions_;

    //! number of items in all partitions
    size_t num_items_ = 0;

    //! number of items emitted
    size_t num_emitted_ = 0;

    //! number of partition flushes
    size_t num_flushes_ = 0;
};

} // namespace core
} // namespace wordtally

#endif // !WORDTALLY_CORE_REDUCE_PRE_TABLE_HEADER

/******************************************************************************/
