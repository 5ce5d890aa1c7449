/*******************************************************************************
 * wordtally/common/logger.cpp
 *
 * Thread naming for the tlx LOG and sLOG macros.
 *
 * Part of Project Wordtally
 *
 * Copyright (C) 2015 Timo Bingmann <tb@panthema.net>
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <wordtally/common/logger.hpp>

#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>
#include <thread>

namespace wordtally {
namespace common {

//! thread name
static thread_local std::string s_thread_name;

//! thread message counter
static thread_local size_t s_message_counter = 0;

void NameThisThread(const std::string& name) {
    s_thread_name = name;
    s_message_counter = 0;
}

std::string GetNameForThisThread() {
    if (!s_thread_name.empty())
        return s_thread_name;

    std::ostringstream oss;
    oss << "unknown " << std::this_thread::get_id();
    return oss.str();
}

/******************************************************************************/

class ThreadLoggerPrefixHook final : public tlx::LoggerPrefixHook
{
public:
    //! constructor
    ThreadLoggerPrefixHook();

    //! virtual destructor
    ~ThreadLoggerPrefixHook();

    //! method to add prefix to log lines
    void add_log_prefix(std::ostream& os) final;

private:
    tlx::LoggerPrefixHook* prev_;
};

//! default logger singleton
static ThreadLoggerPrefixHook s_default_logger;

ThreadLoggerPrefixHook::ThreadLoggerPrefixHook() {
    prev_ = tlx::set_logger_prefix_hook(this);
}

ThreadLoggerPrefixHook::~ThreadLoggerPrefixHook() {
    tlx::set_logger_prefix_hook(prev_);
}

void ThreadLoggerPrefixHook::add_log_prefix(std::ostream& os) {
    os << '[';

    if (!s_thread_name.empty()) {
        os << s_thread_name << ' ';
    }
    else {
        os << "unknown " << std::this_thread::get_id() << ' ';
    }

    std::ios::fmtflags flags(os.flags());
    char fill = os.fill('0');
    os << std::setw(6) << s_message_counter++;
    os.fill(fill);
    os.flags(flags);

    os << ']' << ' ';
}

} // namespace common
} // namespace wordtally

/******************************************************************************/
