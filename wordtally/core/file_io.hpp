/*******************************************************************************
 * wordtally/core/file_io.hpp
 *
 * Part of Project Wordtally
 *
 * Copyright (C) 2015 Alexander Noe <aleexnoe@gmail.com>
 * Copyright (C) 2015 Timo Bingmann <tb@panthema.net>
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef WORDTALLY_CORE_FILE_IO_HEADER
#define WORDTALLY_CORE_FILE_IO_HEADER

#include <cassert>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <sys/types.h>
#include <unistd.h>

namespace wordtally {
namespace core {

//! General information of system file.
struct SysFileInfo {
    //! path to file
    std::string path;
    //! size of file.
    uint64_t    size;
    //! exclusive prefix sum of file sizes.
    uint64_t    size_ex_psum;

    //! inclusive prefix sum of file sizes.
    uint64_t    size_inc_psum() const { return size_ex_psum + size; }
};

//! List of file info and overall info.
struct SysFileList {
    //! list of files.
    std::vector<SysFileInfo> list;

    //! total size of files
    uint64_t                 total_size;

    //! number of files
    size_t                   count() const { return list.size(); }

    const SysFileInfo& operator [] (size_t i) const { return list[i]; }
};

/*!
 * Returns a vector of all files found by glob in the input path, sorted.
 *
 * \param path Input path
 */
std::vector<std::string> GlobFilePattern(const std::string& path);

/*!
 * Returns a vector of the regular files in a directory, sorted. Hidden files
 * whose names start with '.' or '_' are skipped.
 */
std::vector<std::string> ListDirectory(const std::string& path);

/*!
 * Expands each input path into files and returns them with sizes and size
 * prefixsums (in bytes). A path may name a regular file, a directory (see
 * ListDirectory()) or a glob pattern. Throws if a path matches nothing.
 *
 * \param paths Input paths
 */
SysFileList GlobFileSizePrefixSum(const std::vector<std::string>& paths);

/*!
 * Represents a POSIX system file via its file descriptor.
 */
class SysFile
{
    static constexpr bool debug = false;

public:
    //! default constructor
    SysFile() : fd_(-1) { }

    /*!
     * Open file for reading and return file descriptor. Throws an
     * ErrnoException if the file cannot be opened.
     *
     * \param path Path to open
     */
    static SysFile OpenForRead(const std::string& path);

    /*!
     * Open file for writing, create it or truncate it. Throws an
     * ErrnoException if the file cannot be opened.
     *
     * \param path Path to open
     */
    static SysFile OpenForWrite(const std::string& path);

    //! non-copyable: delete copy-constructor
    SysFile(const SysFile&) = delete;
    //! non-copyable: delete assignment operator
    SysFile& operator = (const SysFile&) = delete;
    //! move-constructor
    SysFile(SysFile&& f) noexcept
        : fd_(f.fd_), path_(std::move(f.path_)) {
        f.fd_ = -1;
    }
    //! move-assignment
    SysFile& operator = (SysFile&& f) {
        close_nothrow();
        fd_ = f.fd_, path_ = std::move(f.path_);
        f.fd_ = -1;
        return *this;
    }

    //! POSIX write function.
    ssize_t write(const void* data, size_t count) {
        assert(fd_ >= 0);
        return ::write(fd_, data, count);
    }

    //! POSIX read function.
    ssize_t read(void* data, size_t count) {
        assert(fd_ >= 0);
        return ::read(fd_, data, count);
    }

    //! POSIX lseek function from current position.
    off_t lseek(off_t offset) {
        assert(fd_ >= 0);
        return ::lseek(fd_, offset, SEEK_CUR);
    }

    //! write all count bytes, retrying partial writes. Throws on error.
    void write_all(const void* data, size_t count);

    //! close the file descriptor. Throws an ErrnoException if close() fails,
    //! which for written files may report a delayed write error.
    void close();

    //! whether a file descriptor is held
    bool is_open() const { return fd_ >= 0; }

    //! path the file was opened with
    const std::string& path() const { return path_; }

    ~SysFile() {
        close_nothrow();
    }

private:
    //! private constructor: use OpenForRead or OpenForWrite.
    SysFile(int fd, const std::string& path) noexcept
        : fd_(fd), path_(path) { }

    //! close the file descriptor, log errors.
    void close_nothrow() noexcept;

    //! file descriptor
    int fd_ = -1;

    //! path for error messages
    std::string path_;
};

} // namespace core
} // namespace wordtally

#endif // !WORDTALLY_CORE_FILE_IO_HEADER

/******************************************************************************/
