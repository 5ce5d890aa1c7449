/*******************************************************************************
 * wordtally/core/file_io.cpp
 *
 * Part of Project Wordtally
 *
 * Copyright (C) 2015 Alexander Noe <aleexnoe@gmail.com>
 * Copyright (C) 2015 Timo Bingmann <tb@panthema.net>
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <wordtally/core/file_io.hpp>

#include <wordtally/common/logger.hpp>
#include <wordtally/common/system_exception.hpp>

#include <dirent.h>
#include <fcntl.h>
#include <glob.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

namespace wordtally {
namespace core {

std::vector<std::string> GlobFilePattern(const std::string& path) {

    std::vector<std::string> files;

    glob_t glob_result;
    int r = glob(path.c_str(), GLOB_TILDE, nullptr, &glob_result);
    if (r != 0 && r != GLOB_NOMATCH) {
        globfree(&glob_result);
        throw common::SystemException("Error expanding glob " + path);
    }

    for (unsigned int i = 0; i < glob_result.gl_pathc; ++i) {
        files.push_back(glob_result.gl_pathv[i]);
    }
    globfree(&glob_result);

    std::sort(files.begin(), files.end());

    return files;
}

std::vector<std::string> ListDirectory(const std::string& path) {

    std::vector<std::string> files;

    DIR* dir = opendir(path.c_str());
    if (dir == nullptr) {
        throw common::ErrnoException("Cannot open directory " + path);
    }

    struct dirent* de;
    while ((de = readdir(dir)) != nullptr) {
        if (de->d_name[0] == '.' || de->d_name[0] == '_') continue;

        std::string file = path + '/' + de->d_name;

        struct stat st;
        if (stat(file.c_str(), &st) != 0) {
            int err = errno;
            closedir(dir);
            throw common::ErrnoException("Cannot stat file " + file, err);
        }
        if (!S_ISREG(st.st_mode)) continue;

        files.emplace_back(std::move(file));
    }
    closedir(dir);

    std::sort(files.begin(), files.end());

    return files;
}

SysFileList GlobFileSizePrefixSum(const std::vector<std::string>& paths) {
    static constexpr bool debug = false;

    std::vector<std::string> files;

    for (const std::string& path : paths) {
        struct stat st;
        std::vector<std::string> list;

        if (stat(path.c_str(), &st) == 0) {
            if (S_ISDIR(st.st_mode))
                list = ListDirectory(path);
            else
                list.push_back(path);
        }
        else {
            list = GlobFilePattern(path);
            if (list.size() == 0) {
                throw common::SystemException(
                          "No files found matching file/glob: " + path);
            }
        }
        sLOG << "input path" << path << "matched" << list.size() << "files";
        files.insert(files.end(), list.begin(), list.end());
    }

    std::vector<SysFileInfo> file_info;
    uint64_t total_size = 0;

    for (const std::string& file : files) {
        struct stat filestat;
        if (stat(file.c_str(), &filestat) != 0) {
            throw common::ErrnoException("Invalid file " + file);
        }
        if (!S_ISREG(filestat.st_mode)) continue;

        file_info.emplace_back(
            SysFileInfo { file,
                          static_cast<uint64_t>(filestat.st_size), total_size });

        total_size += filestat.st_size;
    }

    return SysFileList { std::move(file_info), total_size };
}

/******************************************************************************/

SysFile SysFile::OpenForRead(const std::string& path) {
    static constexpr bool debug = false;

    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC, 0);
    if (fd < 0) {
        throw common::ErrnoException("Cannot open file " + path);
    }

    sLOG << "SysFile::OpenForRead(): filefd" << fd;

    return SysFile(fd, path);
}

SysFile SysFile::OpenForWrite(const std::string& path) {
    static constexpr bool debug = false;

    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                    S_IREAD | S_IWRITE | S_IRGRP | S_IROTH);
    if (fd < 0) {
        throw common::ErrnoException("Cannot create file " + path);
    }

    sLOG << "SysFile::OpenForWrite(): filefd" << fd;

    return SysFile(fd, path);
}

void SysFile::write_all(const void* data, size_t count) {
    const char* cdata = static_cast<const char*>(data);
    while (count > 0) {
        ssize_t wb = write(cdata, count);
        if (wb < 0) {
            if (errno == EINTR) continue;
            throw common::ErrnoException("Write error on " + path_);
        }
        cdata += wb;
        count -= static_cast<size_t>(wb);
    }
}

void SysFile::close() {
    if (fd_ < 0) return;

    sLOG << "SysFile::close(): fd" << fd_;
    int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0) {
        throw common::ErrnoException("Cannot close file " + path_);
    }
}

void SysFile::close_nothrow() noexcept {
    if (fd_ < 0) return;

    if (::close(fd_) != 0)
    {
        LOG1 << "SysFile::close()"
             << " fd_=" << fd_
             << " path=" << path_
             << " errno=" << errno
             << " error=" << strerror(errno);
    }
    fd_ = -1;
}

} // namespace core
} // namespace wordtally

/******************************************************************************/
