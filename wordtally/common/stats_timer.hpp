/*******************************************************************************
 * wordtally/common/stats_timer.hpp
 *
 * Part of Project Wordtally
 *
 * Copyright (C) 2014 Thomas Keh <thomas.keh@student.kit.edu>
 * Copyright (C) 2015 Timo Bingmann <tb@panthema.net>
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef WORDTALLY_COMMON_STATS_TIMER_HEADER
#define WORDTALLY_COMMON_STATS_TIMER_HEADER

#include <cassert>
#include <chrono>
#include <ostream>

namespace wordtally {
namespace common {

/*!
 * This class provides a statistical stop watch timer.
 *
 * It uses std::chrono to get the current time when Start() is called. Then,
 * after some processing, Stop() can be called, or Milliseconds() and other
 * accessors can be called directly.
 */
class StatsTimer
{
public:
    using steady_clock = std::chrono::steady_clock;
    using time_point = std::chrono::steady_clock::time_point;

    using duration = std::chrono::microseconds;

protected:
    //! boolean whether the timer is currently running
    bool running_;

    //! total accumulated time in microseconds.
    duration accumulated_;

    //! last start time of the stop watch
    time_point last_start_;

public:
    //! Initialize and optionally immediately start the timer
    explicit StatsTimer(bool start_immediately)
        : running_(false), accumulated_() {
        if (start_immediately) Start();
    }

    //! Whether the timer is running
    bool running() const {
        return running_;
    }

    //! start timer
    StatsTimer& Start() {
        assert(!running_);
        running_ = true;
        last_start_ = steady_clock::now();
        return *this;
    }

    //! stop timer
    StatsTimer& Stop() {
        assert(running_);
        running_ = false;
        accumulated_ += std::chrono::duration_cast<duration>(
            steady_clock::now() - last_start_);
        return *this;
    }

    //! return currently accumulated time
    duration Accumulated() const {
        duration d = accumulated_;

        if (running_)
            d += std::chrono::duration_cast<duration>(
                steady_clock::now() - last_start_);

        return d;
    }

    //! return currently accumulated time in microseconds
    std::chrono::microseconds::rep Microseconds() const {
        return std::chrono::duration_cast<std::chrono::microseconds>(
            Accumulated()).count();
    }

    //! return currently accumulated time in milliseconds
    std::chrono::milliseconds::rep Milliseconds() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            Accumulated()).count();
    }

    //! return currently accumulated time in seconds as double with microseconds
    //! precision
    double SecondsDouble() const {
        return static_cast<double>(Microseconds()) / 1e6;
    }

    //! direct <<-operator for ostream. Can be used for printing with std::cout.
    friend std::ostream& operator << (std::ostream& os, const StatsTimer& t) {
        return os << t.SecondsDouble();
    }
};

class StatsTimerStart : public StatsTimer
{
public:
    //! Initialize and automatically start the timer
    StatsTimerStart()
        : StatsTimer(/* start_immediately */ true) { }
};

class StatsTimerStopped : public StatsTimer
{
public:
    //! Initialize but do NOT automatically start the timer
    StatsTimerStopped()
        : StatsTimer(/* start_immediately */ false) { }
};

} // namespace common
} // namespace wordtally

#endif // !WORDTALLY_COMMON_STATS_TIMER_HEADER

/******************************************************************************/
