/*******************************************************************************
 * wordtally/core/line_reader.hpp
 *
 * Reads the lines of one worker's byte range of a list of files.
 *
 * Part of Project Wordtally
 *
 * Copyright (C) 2015 Alexander Noe <aleexnoe@gmail.com>
 * Copyright (C) 2015 Timo Bingmann <tb@panthema.net>
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef WORDTALLY_CORE_LINE_READER_HEADER
#define WORDTALLY_CORE_LINE_READER_HEADER

#include <wordtally/common/math.hpp>
#include <wordtally/core/file_io.hpp>

#include <string>
#include <vector>

namespace wordtally {
namespace core {

/*!
 * LineReader gives access to the lines of a byte range [begin,end) of the
 * concatenation of all files in a SysFileList.
 *
 * A line belongs to the range containing its first byte, such that the ranges
 * of common::CalculateLocalRange() for all workers deliver every line of the
 * input exactly once. Lines do not span files: the end of a file ends the line
 * even without a trailing newline. The newline itself is not part of the line.
 *
 * Read errors throw an ErrnoException.
 */
class LineReader
{
    static constexpr bool debug = false;

public:
    //! Block read size
    static constexpr size_t read_size = 2 * 1024 * 1024;

    LineReader(const SysFileList& files, const common::Range& range);

    //! non-copyable: delete copy-constructor
    LineReader(const LineReader&) = delete;
    //! non-copyable: delete assignment operator
    LineReader& operator = (const LineReader&) = delete;

    //! returns true, if a line is available in the local range
    bool HasNext();

    //! returns the next line. The reference is valid until the next call to
    //! HasNext(). Requires HasNext() to be true.
    const std::string& Next();

    //! \name Statistics
    //! \{

    //! number of bytes read from files
    size_t total_bytes() const { return total_bytes_; }

    //! number of read() calls
    size_t total_reads() const { return total_reads_; }

    //! number of lines delivered
    size_t total_lines() const { return total_lines_; }

    //! \}

private:
    //! Input files with size prefixsum.
    const SysFileList& files_;
    //! (exclusive) [begin,end) of the local byte range
    common::Range range_;

    //! Index of current file in files_
    size_t file_nr_ = 0;
    //! File handle to files_[file_nr_], closed if no file is open
    SysFile file_;
    //! local end of the range in the current file
    uint64_t file_end_ = 0;
    //! offset of the next unread byte in the current file
    uint64_t offset_ = 0;

    //! Byte buffer of the current block.
    std::vector<char> buffer_;
    //! position of next byte in buffer_
    size_t current_ = 0;
    //! valid bytes in buffer_
    size_t buffer_end_ = 0;

    //! String, which Next() references to
    std::string data_;
    //! whether data_ holds a line not yet returned by Next()
    bool fetched_ = false;
    //! result of the last fetch
    bool has_line_ = false;

    size_t total_bytes_ = 0;
    size_t total_reads_ = 0;
    size_t total_lines_ = 0;

    //! open the next file overlapping range_, position at the first line
    //! starting inside the range. Returns false if there are no more files.
    bool OpenNextFile();

    //! read the next block of the current file. Returns false on EOF.
    bool ReadBlock();

    //! read up to and including the next newline into data_ (without the
    //! newline). Returns false if the file was at EOF.
    bool ReadLine(bool keep);

    //! fetch the next line of the range into data_.
    bool FetchLine();
};

} // namespace core
} // namespace wordtally

#endif // !WORDTALLY_CORE_LINE_READER_HEADER

/******************************************************************************/
