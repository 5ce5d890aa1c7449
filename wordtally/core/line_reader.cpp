/*******************************************************************************
 * wordtally/core/line_reader.cpp
 *
 * Part of Project Wordtally
 *
 * Copyright (C) 2015 Alexander Noe <aleexnoe@gmail.com>
 * Copyright (C) 2015 Timo Bingmann <tb@panthema.net>
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <wordtally/core/line_reader.hpp>

#include <wordtally/common/logger.hpp>
#include <wordtally/common/system_exception.hpp>

#include <tlx/define/likely.hpp>

#include <algorithm>
#include <cassert>
#include <cerrno>
#include <string>

namespace wordtally {
namespace core {

LineReader::LineReader(const SysFileList& files, const common::Range& range)
    : files_(files), range_(range) {
    assert(range_.begin <= range_.end);
    data_.reserve(4 * 1024);
}

bool LineReader::OpenNextFile() {
    while (file_nr_ < files_.count())
    {
        const SysFileInfo& fi = files_[file_nr_++];

        // intersect the range with the file's global byte range
        uint64_t begin = std::max<uint64_t>(range_.begin, fi.size_ex_psum);
        uint64_t end = std::min<uint64_t>(range_.end, fi.size_inc_psum());
        if (begin >= end) continue;

        uint64_t local_begin = begin - fi.size_ex_psum;
        file_end_ = end - fi.size_ex_psum;

        sLOG << "LineReader: opening file" << fi.path
             << "range" << range_ << "local" << local_begin << file_end_;

        file_ = SysFile::OpenForRead(fi.path);
        current_ = buffer_end_ = 0;
        offset_ = 0;

        if (local_begin == 0)
            return true;

        // back up one byte and discard everything up to the next newline: the
        // previous range covers the line containing local_begin - 1.
        offset_ = local_begin - 1;
        if (file_.lseek(static_cast<off_t>(offset_)) < 0) {
            throw common::ErrnoException("Cannot seek in file " + fi.path);
        }
        if (ReadLine(/* keep */ false) && offset_ < file_end_)
            return true;

        file_.close();
    }
    return false;
}

bool LineReader::ReadBlock() {
    if (buffer_.size() != read_size)
        buffer_.resize(read_size);

    ssize_t bytes;
    do {
        bytes = file_.read(buffer_.data(), read_size);
    } while (bytes < 0 && errno == EINTR);

    if (bytes < 0) {
        throw common::ErrnoException("Read error on " + file_.path());
    }
    current_ = 0;
    buffer_end_ = static_cast<size_t>(bytes);
    total_bytes_ += buffer_end_;
    total_reads_++;
    sLOG << "LineReader: read block containing" << bytes << "bytes.";
    return bytes > 0;
}

bool LineReader::ReadLine(bool keep) {
    if (keep) data_.clear();
    bool any = false;

    while (true) {
        if (current_ == buffer_end_ && !ReadBlock())
            return any;

        any = true;
        const char* begin = buffer_.data() + current_;
        const char* end = buffer_.data() + buffer_end_;
        const char* nl = std::find(begin, end, '\n');

        if (keep) data_.append(begin, nl);
        offset_ += nl - begin;
        current_ += nl - begin;

        if (TLX_LIKELY(nl != end)) {
            // consume newline
            ++offset_, ++current_;
            return true;
        }
    }
}

bool LineReader::FetchLine() {
    while (true) {
        if (!file_.is_open() && !OpenNextFile())
            return false;

        // lines starting at or after file_end_ belong to the next range
        if (offset_ < file_end_ && ReadLine(/* keep */ true))
            return true;

        file_.close();
    }
}

bool LineReader::HasNext() {
    if (!fetched_) {
        has_line_ = FetchLine();
        fetched_ = true;
    }
    return has_line_;
}

const std::string& LineReader::Next() {
    assert(fetched_ && has_line_);
    fetched_ = false;
    total_lines_++;
    return data_;
}

} // namespace core
} // namespace wordtally

/******************************************************************************/
