/*******************************************************************************
 * wordtally/common/logger.hpp
 *
 * Thread naming for the tlx LOG and sLOG macros.
 *
 * Part of Project Wordtally
 *
 * Copyright (C) 2015 Timo Bingmann <tb@panthema.net>
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef WORDTALLY_COMMON_LOGGER_HEADER
#define WORDTALLY_COMMON_LOGGER_HEADER

#include <tlx/logger.hpp>

#include <string>

namespace wordtally {
namespace common {

//! Defines a name for the current thread.
void NameThisThread(const std::string& name);

//! Returns the name of the current thread or 'unknown [id]'
std::string GetNameForThisThread();

/******************************************************************************/

/*!

\brief LOG and sLOG for development and debugging

The macros come from tlx: \ref LOG prints a line with spaces exactly as
streamed, \ref sLOG inserts a space between each streamed item. Both only
print if the boolean variable **debug** found in the enclosing scope is true.

\code
class LineReader
{
    static constexpr bool debug = false;

    void Open()
    {
        sLOG << "opening file" << path << "at offset" << offset;

        LOG1 << "This is always printed.";
    }
};
\endcode

Each line is prefixed with the name of the thread (set with NameThisThread())
and a per-thread message counter, e.g. `[worker 3 000012] `. Job workers are
named `worker <rank>` by the pipeline driver.

 */

} // namespace common
} // namespace wordtally

#endif // !WORDTALLY_COMMON_LOGGER_HEADER

/******************************************************************************/
