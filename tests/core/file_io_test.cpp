/*******************************************************************************
 * tests/core/file_io_test.cpp
 *
 * Part of Project Wordtally
 *
 * Copyright (C) 2015 Alexander Noe <aleexnoe@gmail.com>
 * Copyright (C) 2015 Timo Bingmann <tb@panthema.net>
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <wordtally/common/system_exception.hpp>
#include <wordtally/core/file_io.hpp>
#include <wordtally/core/temporary_directory.hpp>

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

using namespace wordtally;

TEST(FileIO, GlobFileSizePrefixSum) {
    core::TemporaryDirectory tmp;
    tmp.WriteFile("part-1", "12345");
    tmp.WriteFile("part-0", "abc");
    tmp.WriteFile("other", "xy");
    tmp.WriteFile("_SUCCESS", "");
    tmp.WriteFile(".hidden", "hidden");

    // glob
    core::SysFileList files = core::GlobFileSizePrefixSum(
        { tmp.path("part-*") });
    ASSERT_EQ(2u, files.count());
    ASSERT_EQ(tmp.path("part-0"), files[0].path);
    ASSERT_EQ(3u, files[0].size);
    ASSERT_EQ(0u, files[0].size_ex_psum);
    ASSERT_EQ(tmp.path("part-1"), files[1].path);
    ASSERT_EQ(3u, files[1].size_ex_psum);
    ASSERT_EQ(8u, files[1].size_inc_psum());
    ASSERT_EQ(8u, files.total_size);

    // directory skips hidden files
    files = core::GlobFileSizePrefixSum({ tmp.get() });
    ASSERT_EQ(3u, files.count());
    ASSERT_EQ(tmp.path("other"), files[0].path);
    ASSERT_EQ(10u, files.total_size);

    // plain file
    files = core::GlobFileSizePrefixSum({ tmp.path(".hidden") });
    ASSERT_EQ(1u, files.count());
    ASSERT_EQ(6u, files.total_size);
}

TEST(FileIO, MissingInputThrows) {
    core::TemporaryDirectory tmp;
    ASSERT_THROW(core::GlobFileSizePrefixSum({ tmp.path("does-not-exist") }),
                 common::SystemException);
    ASSERT_THROW(core::GlobFileSizePrefixSum({ tmp.path("nothing-*") }),
                 common::SystemException);
    ASSERT_THROW(core::SysFile::OpenForRead(tmp.path("does-not-exist")),
                 common::ErrnoException);
    ASSERT_THROW(core::SysFile::OpenForWrite(tmp.path("no-dir/file")),
                 common::ErrnoException);
}

TEST(FileIO, EmptyDirectory) {
    core::TemporaryDirectory tmp;
    core::SysFileList files = core::GlobFileSizePrefixSum({ tmp.get() });
    ASSERT_EQ(0u, files.count());
    ASSERT_EQ(0u, files.total_size);
}

TEST(FileIO, WriteReadMove) {
    core::TemporaryDirectory tmp;

    core::SysFile out = core::SysFile::OpenForWrite(tmp.path("data"));
    ASSERT_TRUE(out.is_open());

    core::SysFile moved = std::move(out);
    ASSERT_FALSE(out.is_open());
    ASSERT_TRUE(moved.is_open());

    std::string data(100000, 'x');
    moved.write_all(data.data(), data.size());
    moved.close();
    ASSERT_FALSE(moved.is_open());

    ASSERT_EQ(data, tmp.ReadFile("data"));
}

/******************************************************************************/
