/*******************************************************************************
 * wordtally/common/system_exception.hpp
 *
 * Part of Project Wordtally
 *
 * Copyright (C) 2015 Timo Bingmann <tb@panthema.net>
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef WORDTALLY_COMMON_SYSTEM_EXCEPTION_HEADER
#define WORDTALLY_COMMON_SYSTEM_EXCEPTION_HEADER

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

namespace wordtally {
namespace common {

/*!
 * An Exception which is thrown on system errors.
 */
class SystemException : public std::runtime_error
{
public:
    explicit SystemException(const std::string& what)
        : std::runtime_error(what) { }
};

/*!
 * An Exception which is thrown on system errors and contains errno information.
 */
class ErrnoException : public SystemException
{
public:
    ErrnoException(const std::string& what, int _errno)
        : SystemException(
              what + ": [" + std::to_string(_errno) + "] " + strerror(_errno))
    { }

    //! take the current errno
    explicit ErrnoException(const std::string& what)
        : ErrnoException(what, errno) { }
};

} // namespace common
} // namespace wordtally

#endif // !WORDTALLY_COMMON_SYSTEM_EXCEPTION_HEADER

/******************************************************************************/
