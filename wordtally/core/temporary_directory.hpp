/*******************************************************************************
 * wordtally/core/temporary_directory.hpp
 *
 * Part of Project Wordtally
 *
 * Copyright (C) 2015 Timo Bingmann <tb@panthema.net>
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef WORDTALLY_CORE_TEMPORARY_DIRECTORY_HEADER
#define WORDTALLY_CORE_TEMPORARY_DIRECTORY_HEADER

#include <string>

namespace wordtally {
namespace core {

/*!
 * A class which creates a temporary directory in the current directory and
 * returns it via get(). When the object is destroyed the temporary directory is
 * wiped non-recursively. Used by the test suite to hold input and output files.
 */
class TemporaryDirectory
{
public:
    //! Create a temporary directory, returns its name without trailing /.
    static std::string make_directory(
        const char* sample = "wordtally-testsuite-");

    //! wipe temporary directory NON RECURSIVELY! Returns false and logs if the
    //! directory could not be read.
    static bool wipe_directory(const std::string& tmp_dir, bool do_rmdir);

    TemporaryDirectory()
        : dir_(make_directory())
    { }

    ~TemporaryDirectory() {
        wipe_directory(dir_, true);
    }

    //! non-copyable: delete copy-constructor
    TemporaryDirectory(const TemporaryDirectory&) = delete;
    //! non-copyable: delete assignment operator
    TemporaryDirectory& operator = (const TemporaryDirectory&) = delete;

    //! return the temporary directory name
    const std::string& get() const { return dir_; }

    //! return the path of a file inside the directory
    std::string path(const std::string& name) const {
        return dir_ + "/" + name;
    }

    //! write a file inside the directory and return its path
    std::string WriteFile(const std::string& name,
                          const std::string& content) const;

    //! read a whole file inside the directory
    std::string ReadFile(const std::string& name) const;

    //! wipe contents of directory
    void wipe() const {
        wipe_directory(dir_, false);
    }

private:
    std::string dir_;
};

} // namespace core
} // namespace wordtally

#endif // !WORDTALLY_CORE_TEMPORARY_DIRECTORY_HEADER

/******************************************************************************/
