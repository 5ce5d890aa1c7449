/*******************************************************************************
 * tests/common/logger_test.cpp
 *
 * Part of Project Wordtally
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <wordtally/common/logger.hpp>
#include <wordtally/common/stats_timer.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>

using namespace wordtally;

TEST(Logger, NameThisThread) {
    std::string name_in_thread;

    std::thread t([&name_in_thread]() {
                      common::NameThisThread("worker 7");
                      LOG1 << "logging from a named thread";
                      name_in_thread = common::GetNameForThisThread();
                  });
    t.join();

    ASSERT_EQ("worker 7", name_in_thread);
}

TEST(Logger, UnnamedThread) {
    std::string name_in_thread;

    std::thread t([&name_in_thread]() {
                      name_in_thread = common::GetNameForThisThread();
                  });
    t.join();

    ASSERT_EQ(0u, name_in_thread.find("unknown "));
}

TEST(StatsTimer, StartStop) {
    common::StatsTimerStart timer;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    timer.Stop();

    auto ms = timer.Milliseconds();
    ASSERT_GE(ms, 19);

    // stopped timer does not advance
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    ASSERT_EQ(ms, timer.Milliseconds());

    common::StatsTimerStopped stopped;
    ASSERT_EQ(0, stopped.Microseconds());
}

/******************************************************************************/
