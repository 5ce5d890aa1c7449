/*******************************************************************************
 * wordtally/common/math.hpp
 *
 * Index ranges and their partitioning among workers.
 *
 * Part of Project Wordtally
 *
 * Copyright (C) 2015 Timo Bingmann <tb@panthema.net>
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef WORDTALLY_COMMON_MATH_HEADER
#define WORDTALLY_COMMON_MATH_HEADER

#include <cassert>
#include <cstddef>
#include <ostream>

namespace wordtally {
namespace common {

//! represents a 1 dimensional range (interval) [begin,end)
class Range
{
public:
    Range() = default;
    Range(size_t begin, size_t end) : begin(begin), end(end) { }

    //! \name Attributes
    //! \{

    //! begin index
    size_t begin = 0;
    //! end index
    size_t end = 0;

    //! \}

    //! size of range
    size_t size() const { return end - begin; }

    //! range is empty (begin == end)
    bool IsEmpty() const { return begin == end; }

    //! true if the Range contains x
    bool Contains(size_t x) const {
        return x >= begin && x < end;
    }

    //! calculate a partition range [begin,end) by taking the current Range
    //! splitting it into p parts and taking the i-th one.
    Range Partition(size_t i, size_t parts) const {
        assert(i < parts);
        return Range(CalculateBeginOfPart(i, parts),
                     CalculateBeginOfPart(i + 1, parts));
    }

    size_t CalculateBeginOfPart(size_t i, size_t parts) const {
        assert(i <= parts);
        return (i * size() + parts - 1) / parts + begin;
    }

    //! ostream-able
    friend std::ostream& operator << (std::ostream& os, const Range& r) {
        return os << '[' << r.begin << ',' << r.end << ')';
    }
};

//! given a global range [0,global_size) and p PEs to split the range, calculate
//! the [local_begin,local_end) index range assigned to the PE i.
static inline Range CalculateLocalRange(
    size_t global_size, size_t p, size_t i) {
    return Range(0, global_size).Partition(i, p);
}

} // namespace common
} // namespace wordtally

#endif // !WORDTALLY_COMMON_MATH_HEADER

/******************************************************************************/
