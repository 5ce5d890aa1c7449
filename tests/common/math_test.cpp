/*******************************************************************************
 * tests/common/math_test.cpp
 *
 * Part of Project Wordtally
 *
 * Copyright (C) 2015 Timo Bingmann <tb@panthema.net>
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <wordtally/common/hash.hpp>
#include <wordtally/common/logger.hpp>
#include <wordtally/common/math.hpp>

#include <gtest/gtest.h>

#include <sstream>
#include <vector>

using namespace wordtally;

TEST(Math, CalculateLocalRangeCoversAll) {
    static constexpr bool debug = false;

    for (size_t global = 0; global < 100; global += 7) {
        for (size_t p = 1; p < 12; ++p) {
            size_t next = 0;
            for (size_t i = 0; i < p; ++i) {
                common::Range r = common::CalculateLocalRange(global, p, i);
                sLOG << "global" << global << "p" << p << "i" << i << r;

                // ranges are adjacent and at most one item apart in size
                ASSERT_EQ(next, r.begin);
                ASSERT_LE(r.begin, r.end);
                ASSERT_LE(r.size(), (global + p - 1) / p);
                ASSERT_GE(r.size(), global / p);
                next = r.end;
            }
            ASSERT_EQ(global, next);
        }
    }
}

TEST(Math, RangeAttributes) {
    common::Range r(4, 10);
    ASSERT_EQ(6u, r.size());
    ASSERT_FALSE(r.IsEmpty());
    ASSERT_TRUE(r.Contains(4));
    ASSERT_TRUE(r.Contains(9));
    ASSERT_FALSE(r.Contains(10));
    ASSERT_TRUE(common::Range(3, 3).IsEmpty());

    ASSERT_EQ(4u, r.Partition(0, 3).begin);
    ASSERT_EQ(10u, r.Partition(2, 3).end);

    std::ostringstream oss;
    oss << r;
    ASSERT_EQ("[4,10)", oss.str());
}

TEST(Hash, Hash128to64Spreads) {
    // consecutive inputs must not collide into few buckets
    std::vector<size_t> buckets(8, 0);
    for (uint64_t i = 0; i < 8000; ++i)
        buckets[common::Hash128to64(0, i) % buckets.size()]++;

    for (const size_t& b : buckets) {
        ASSERT_GT(b, 800u);
        ASSERT_LT(b, 1200u);
    }

    ASSERT_NE(common::Hash128to64(0, 42), common::Hash128to64(1, 42));
}

/******************************************************************************/
