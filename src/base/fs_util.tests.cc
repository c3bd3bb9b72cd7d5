/**
 * Copyright (c) 2024, Timothy Stack
 *
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * * Redistributions of source code must retain the above copyright notice, this
 * list of conditions and the following disclaimer.
 * * Redistributions in binary form must reproduce the above copyright notice,
 * this list of conditions and the following disclaimer in the documentation
 * and/or other materials provided with the distribution.
 * * Neither the name of Timothy Stack nor the names of its contributors
 * may be used to endorse or promote products derived from this software
 * without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE REGENTS AND CONTRIBUTORS ''AS IS'' AND ANY
 * EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 * DISCLAIMED. IN NO EVENT SHALL THE REGENTS OR CONTRIBUTORS BE LIABLE FOR ANY
 * DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
 * (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
 * LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
 * ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#include <fstream>

#include "base/fs_util.hh"

#include <errno.h>
#include <stdlib.h>

#include "base/auto_fd.hh"
#include "base/io_error.hh"
#include "config.h"
#include "doctest/doctest.h"
#include "fmt/format.h"

using namespace tailstream;

TEST_CASE("io_error::classify")
{
    CHECK(io_error::classify(ENOENT) == io_error::kind::not_found);
    CHECK(io_error::classify(ENOTDIR) == io_error::kind::not_found);
    CHECK(io_error::classify(EACCES) == io_error::kind::access_denied);
    CHECK(io_error::classify(EPERM) == io_error::kind::access_denied);
    CHECK(io_error::classify(EIO) == io_error::kind::fatal);
    CHECK(io_error::classify(EMFILE) == io_error::kind::fatal);

    auto err = io_error::from_errno(EIO, "read", "/tmp/foo");
    CHECK_FALSE(err.is_transient());
    CHECK(fmt::format(FMT_STRING("{}"), err)
          == fmt::format(FMT_STRING("read failed for /tmp/foo (fatal) -- {}"),
                         strerror(EIO)));
}

TEST_CASE("fs_util::stat_file")
{
    char dir_template[] = "/tmp/tailstream.fs_util.XXXXXX";
    auto* dir = mkdtemp(dir_template);
    REQUIRE(dir != nullptr);

    auto dir_path = std::filesystem::path(dir);
    auto missing = filesystem::stat_file(dir_path / "missing");
    REQUIRE(missing.isErr());
    auto missing_err = missing.unwrapErr();
    CHECK(missing_err.ie_kind == io_error::kind::not_found);
    CHECK(missing_err.ie_operation == "stat");

    {
        std::ofstream(dir_path / "present") << "hello";
    }
    auto present = filesystem::stat_file(dir_path / "present");
    REQUIRE(present.isOk());
    CHECK(present.unwrap().st_size == 5);

    auto open_res
        = filesystem::open_file(dir_path / "present", O_RDONLY | O_CLOEXEC);
    REQUIRE(open_res.isOk());
    auto fd = open_res.unwrap();
    CHECK(fd.has_value());

    auto fd_st = filesystem::stat_fd(fd, dir_path / "present");
    REQUIRE(fd_st.isOk());
    CHECK(filesystem::is_same_file(present.unwrap(), fd_st.unwrap()));

    std::filesystem::remove(dir_path / "present");
    {
        std::ofstream(dir_path / "present") << "world";
    }
    auto replaced = filesystem::stat_file(dir_path / "present");
    REQUIRE(replaced.isOk());
    CHECK_FALSE(filesystem::is_same_file(replaced.unwrap(), fd_st.unwrap()));

    auto bad_open = filesystem::open_file(dir_path / "missing", O_RDONLY);
    CHECK(bad_open.isErr());

    std::filesystem::remove_all(dir_path);
}

TEST_CASE("fs_util::split_watch_path")
{
    auto abs_split = filesystem::split_watch_path("/var/log/../log/syslog");
    CHECK(abs_split.first == std::filesystem::path("/var/log"));
    CHECK(abs_split.second == "syslog");

    auto rel_split = filesystem::split_watch_path("app.log");
    CHECK(rel_split.first == std::filesystem::current_path());
    CHECK(rel_split.second == "app.log");
}

TEST_CASE("auto_fd")
{
    auto_fd fd1;

    CHECK_FALSE(fd1.has_value());
    CHECK(fd1 == -1);

    int tmp = open("/dev/null", O_RDONLY);
    REQUIRE(tmp != -1);
    fd1.reset(tmp);
    CHECK(fd1 == tmp);

    auto_fd fd2(std::move(fd1));
    CHECK(fd1 == -1);
    CHECK(fd2 == tmp);

    fd2.reset();
    CHECK(fcntl(tmp, F_GETFL) == -1);
    CHECK(errno == EBADF);
}
