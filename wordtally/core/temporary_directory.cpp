/*******************************************************************************
 * wordtally/core/temporary_directory.cpp
 *
 * Part of Project Wordtally
 *
 * Copyright (C) 2015 Timo Bingmann <tb@panthema.net>
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <wordtally/core/temporary_directory.hpp>

#include <wordtally/common/logger.hpp>
#include <wordtally/common/system_exception.hpp>
#include <wordtally/core/file_io.hpp>

#include <cerrno>
#include <cstring>
#include <vector>

#include <dirent.h>
#include <unistd.h>

namespace wordtally {
namespace core {

std::string TemporaryDirectory::make_directory(const char* sample) {

    std::vector<char> tmp_dir(sample, sample + strlen(sample));
    const char suffix[] = "XXXXXX";
    tmp_dir.insert(tmp_dir.end(), suffix, suffix + sizeof(suffix));

    // mkdtemp replaces the XXXXXX with something unique. it also mkdirs.
    char* p = mkdtemp(tmp_dir.data());

    if (p == nullptr) {
        throw common::ErrnoException(
                  "Could not create temporary directory "
                  + std::string(tmp_dir.data()));
    }

    return std::string(p);
}

bool TemporaryDirectory::wipe_directory(
    const std::string& tmp_dir, bool do_rmdir) {
    DIR* d = opendir(tmp_dir.c_str());
    if (d == nullptr) {
        sLOG1 << "Could not open temporary directory" << tmp_dir
              << ":" << strerror(errno);
        return false;
    }

    struct dirent* de;
    while ((de = readdir(d)) != nullptr) {
        if (strcmp(de->d_name, ".") == 0 || strcmp(de->d_name, "..") == 0)
            continue;

        std::string path = tmp_dir + "/" + de->d_name;
        int r = unlink(path.c_str());
        if (r != 0)
            sLOG1 << "Could not unlink temporary file" << path
                  << ":" << strerror(errno);
    }

    closedir(d);

    if (!do_rmdir) return true;

    if (rmdir(tmp_dir.c_str()) != 0) {
        sLOG1 << "Could not unlink temporary directory" << tmp_dir
              << ":" << strerror(errno);
        return false;
    }
    return true;
}

std::string TemporaryDirectory::WriteFile(
    const std::string& name, const std::string& content) const {
    std::string file_path = path(name);
    SysFile file = SysFile::OpenForWrite(file_path);
    file.write_all(content.data(), content.size());
    file.close();
    return file_path;
}

std::string TemporaryDirectory::ReadFile(const std::string& name) const {
    SysFile file = SysFile::OpenForRead(path(name));
    std::string content;
    char buffer[4096];
    ssize_t rb;
    while ((rb = file.read(buffer, sizeof(buffer))) != 0) {
        if (rb < 0) {
            if (errno == EINTR) continue;
            throw common::ErrnoException("Read error on " + file.path());
        }
        content.append(buffer, static_cast<size_t>(rb));
    }
    file.close();
    return content;
}

} // namespace core
} // namespace wordtally

/******************************************************************************/
