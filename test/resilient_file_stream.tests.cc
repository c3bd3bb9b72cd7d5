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

#include <string>
#include <vector>

#include "resilient_file_stream.hh"

#include <errno.h>
#include <stdio.h>

#include "config.h"
#include "doctest/doctest.h"
#include "scoped_tmpdir.hh"

using namespace tailstream;

static std::string
read_all(byte_stream& bs, size_t count = 1024)
{
    std::vector<unsigned char> buf(count);
    auto rc = bs.read(buf, 0, count);

    return std::string(buf.begin(), buf.begin() + rc);
}

TEST_CASE("resilient_file_stream::delete-and-recreate")
{
    scoped_tmpdir tmp;
    auto path = tmp / "numbers.bin";
    const std::vector<unsigned char> expected = {0, 1, 2, 3, 4, 5};
    std::vector<unsigned char> buf(6);

    write_file(path, std::string(expected.begin(), expected.end()));

    resilient_file_stream rfs(path);

    CHECK(rfs.read(buf, 0, 6) == 6);
    CHECK(buf == expected);

    std::filesystem::remove(path);
    CHECK(rfs.read(buf, 0, 6) == 0);
    CHECK_FALSE(rfs.is_bound());

    write_file(path, std::string(expected.begin(), expected.end()));
    std::fill(buf.begin(), buf.end(), 0xff);
    CHECK(rfs.read(buf, 0, 6) == 6);
    CHECK(buf == expected);
}

TEST_CASE("resilient_file_stream::missing-file")
{
    scoped_tmpdir tmp;
    resilient_file_stream rfs(tmp / "not-there.log");
    std::vector<unsigned char> buf(16);

    CHECK(rfs.read(buf, 0, buf.size()) == 0);
    CHECK(rfs.length() == 0);
    CHECK(rfs.position() == 0);
    CHECK(rfs.seek(10, seek_origin::begin) == 0);
    CHECK_FALSE(rfs.is_bound());
    CHECK(rfs.to_string() == "[SFS] not-there.log");
    CHECK(rfs.get_path() == tmp / "not-there.log");
}

TEST_CASE("resilient_file_stream::missing-directory")
{
    scoped_tmpdir tmp;
    resilient_file_stream rfs(tmp / "sub" / "app.log");

    CHECK(rfs.length() == 0);
    CHECK(read_all(rfs).empty());

    std::filesystem::create_directory(tmp / "sub");
    write_file(tmp / "sub" / "app.log", "late\n");
    CHECK(read_all(rfs) == "late\n");
}

TEST_CASE("resilient_file_stream::appears-later")
{
    scoped_tmpdir tmp;
    auto path = tmp / "later.log";
    resilient_file_stream rfs(path, nullptr);

    CHECK(read_all(rfs).empty());
    write_file(path, "first\n");
    CHECK(read_all(rfs) == "first\n");
    CHECK(rfs.position() == 6);

    write_file(path, "second\n", std::ios::app);
    CHECK(read_all(rfs) == "second\n");
    CHECK(rfs.length() == 13);
    CHECK(rfs.position() == 13);

    // end-of-file on a file that is still there keeps the descriptor
    CHECK(read_all(rfs).empty());
    CHECK(rfs.is_bound());
    CHECK(rfs.position() == 13);
}

TEST_CASE("resilient_file_stream::truncated")
{
    scoped_tmpdir tmp;
    auto path = tmp / "trunc.log";

    write_file(path, "hello, world\n");

    resilient_file_stream rfs(path, nullptr);

    CHECK(read_all(rfs) == "hello, world\n");
    write_file(path, "hi\n");
    CHECK(read_all(rfs).empty());
    CHECK_FALSE(rfs.is_bound());
    CHECK(read_all(rfs) == "hi\n");
}

TEST_CASE("resilient_file_stream::replaced-without-watcher")
{
    scoped_tmpdir tmp;
    auto path = tmp / "replaced.log";

    write_file(path, "old\n");

    resilient_file_stream rfs(path, nullptr);

    CHECK(read_all(rfs) == "old\n");
    write_file(tmp / "new.log", "brand new\n");
    std::filesystem::rename(tmp / "new.log", path);
    CHECK(read_all(rfs).empty());
    CHECK(read_all(rfs) == "brand new\n");
}

TEST_CASE("resilient_file_stream::watcher-unbinds")
{
    scoped_tmpdir tmp;
    auto path = tmp / "watched.log";
    auto fw = file_watcher::create();

    write_file(path, "abc\n");

    resilient_file_stream rfs(path, fw);

    CHECK(fw->subscription_count() == 1);
    CHECK(read_all(rfs, 2) == "ab");
    CHECK(rfs.is_bound());

    write_file(tmp / "next.log", "xyz\n");
    std::filesystem::rename(tmp / "next.log", path);
    CHECK(wait_for([&rfs]() { return !rfs.is_bound(); }));
    CHECK(read_all(rfs) == "xyz\n");

    rfs.close();
    CHECK(fw->subscription_count() == 0);
}

TEST_CASE("resilient_file_stream::directory-read-is-fatal")
{
    scoped_tmpdir tmp;
    auto path = tmp / "d";

    std::filesystem::create_directory(path);

    resilient_file_stream rfs(path, nullptr);
    std::vector<unsigned char> buf(16);

    try {
        rfs.read(buf, 0, buf.size());
        FAIL("read of a directory should throw");
    } catch (const io_exception& e) {
        CHECK(e.get_error().ie_errno == EISDIR);
        CHECK(e.get_error().ie_kind == io_error::kind::fatal);
        CHECK(e.get_error().ie_operation == "read");
    }
}

TEST_CASE("resilient_file_stream::symlink-loop-is-fatal")
{
    scoped_tmpdir tmp;

    std::filesystem::create_symlink(tmp / "loop-b", tmp / "loop-a");
    std::filesystem::create_symlink(tmp / "loop-a", tmp / "loop-b");

    resilient_file_stream rfs(tmp / "loop-a", nullptr);

    try {
        rfs.length();
        FAIL("opening a symlink loop should throw");
    } catch (const io_exception& e) {
        CHECK(e.get_error().ie_errno == ELOOP);
        CHECK(e.get_error().ie_kind == io_error::kind::fatal);
        CHECK(e.get_error().ie_operation == "open");
    }
    CHECK_FALSE(rfs.is_bound());
}

TEST_CASE("resilient_file_stream::seek")
{
    scoped_tmpdir tmp;
    auto path = tmp / "seek.log";

    write_file(path, "0123456789");

    resilient_file_stream rfs(path);

    CHECK(rfs.can_read());
    CHECK(rfs.can_seek());
    CHECK(rfs.seek(-3, seek_origin::end) == 7);
    CHECK(read_all(rfs) == "789");
    CHECK(rfs.seek(-5, seek_origin::current) == 5);
    CHECK(read_all(rfs, 2) == "56");
    rfs.set_position(1);
    CHECK(rfs.position() == 1);
    CHECK(read_all(rfs, 1) == "1");

    CHECK_THROWS_AS(rfs.set_position(-1), std::invalid_argument);
    CHECK_THROWS_AS(rfs.seek(-11, seek_origin::end), std::invalid_argument);
    CHECK(rfs.position() == 2);
}

TEST_CASE("resilient_file_stream::read-only")
{
    scoped_tmpdir tmp;
    resilient_file_stream rfs(tmp / "ro.log");
    std::vector<unsigned char> buf = {'a'};

    CHECK_FALSE(rfs.can_write());
    CHECK_THROWS_AS(rfs.write(buf, 0, 1), unsupported_operation);
    CHECK_THROWS_AS(rfs.set_length(0), unsupported_operation);
    rfs.flush();
}

TEST_CASE("resilient_file_stream::close")
{
    scoped_tmpdir tmp;
    auto path = tmp / "closed.log";

    write_file(path, "data\n");

    resilient_file_stream rfs(path);

    CHECK(read_all(rfs, 1) == "d");
    rfs.close();
    CHECK(rfs.is_closed());
    CHECK_FALSE(rfs.is_bound());
    CHECK_THROWS_AS(read_all(rfs), stream_closed);
    CHECK_THROWS_AS(rfs.length(), stream_closed);
    CHECK_THROWS_AS(rfs.position(), stream_closed);
    rfs.close();
}
