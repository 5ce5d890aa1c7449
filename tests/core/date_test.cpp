/*******************************************************************************
 * tests/core/date_test.cpp
 *
 * Part of Project Wordtally
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <wordtally/core/date.hpp>
#include <wordtally/core/record.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace wordtally;

static core::Date Parse(const std::string& text) {
    core::Date d = { 0, 0, 0 };
    EXPECT_TRUE(core::ParseDate(text, &d)) << text;
    return d;
}

static bool Fails(const std::string& text) {
    core::Date d;
    return !core::ParseDate(text, &d);
}

TEST(Date, ParseValid) {
    core::Date d = Parse("17-10-2019");
    ASSERT_EQ(2019, d.year);
    ASSERT_EQ(10u, d.month);
    ASSERT_EQ(17u, d.day);

    ASSERT_EQ(core::kDefaultCutoff, Parse("18-10-2019"));
    ASSERT_EQ("01-01-0001", core::FormatDate(Parse("01-01-0001")));
    ASSERT_EQ("31-12-9999", core::FormatDate(Parse("31-12-9999")));
}

TEST(Date, ParseInvalid) {
    ASSERT_TRUE(Fails(""));
    ASSERT_TRUE(Fails("2019-10-17"));
    ASSERT_TRUE(Fails("17/10/2019"));
    ASSERT_TRUE(Fails("1-10-2019"));
    ASSERT_TRUE(Fails("17-10-19"));
    ASSERT_TRUE(Fails("17-10-2019 "));
    ASSERT_TRUE(Fails(" 17-10-2019"));
    ASSERT_TRUE(Fails("17-10-20190"));
    ASSERT_TRUE(Fails("+7-10-2019"));
    ASSERT_TRUE(Fails("00-10-2019"));
    ASSERT_TRUE(Fails("32-10-2019"));
    ASSERT_TRUE(Fails("17-00-2019"));
    ASSERT_TRUE(Fails("17-13-2019"));
    ASSERT_TRUE(Fails("17-10-0000"));
    ASSERT_TRUE(Fails("aa-bb-cccc"));
}

TEST(Date, ClampDayToMonth) {
    ASSERT_EQ("28-02-2019", core::FormatDate(Parse("31-02-2019")));
    ASSERT_EQ("29-02-2020", core::FormatDate(Parse("30-02-2020")));
    ASSERT_EQ("30-04-2019", core::FormatDate(Parse("31-04-2019")));
    ASSERT_EQ("28-02-1900", core::FormatDate(Parse("29-02-1900")));
    ASSERT_EQ("29-02-2000", core::FormatDate(Parse("29-02-2000")));
}

TEST(Date, Ordering) {
    ASSERT_LT(Parse("31-12-2018"), Parse("01-01-2019"));
    ASSERT_LT(Parse("30-09-2019"), Parse("01-10-2019"));
    ASSERT_LT(Parse("17-10-2019"), Parse("18-10-2019"));
    ASSERT_GT(Parse("19-10-2019"), Parse("18-10-2019"));
    ASSERT_LE(Parse("18-10-2019"), Parse("18-10-2019"));
    ASSERT_NE(Parse("18-10-2019"), Parse("18-10-2020"));
}

TEST(Date, CutoffBoundary) {
    ASSERT_TRUE(core::IsIncluded(Parse("17-10-2019"), core::kDefaultCutoff));
    ASSERT_FALSE(core::IsIncluded(Parse("18-10-2019"), core::kDefaultCutoff));
    ASSERT_FALSE(core::IsIncluded(Parse("19-10-2019"), core::kDefaultCutoff));
    ASSERT_TRUE(core::IsIncluded(Parse("01-01-1970"), core::kDefaultCutoff));
}

/******************************************************************************/
