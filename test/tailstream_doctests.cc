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

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <vector>

#include "byte_stream.hh"
#include "config.h"
#include "doctest/doctest.h"
#include "memory_stream.hh"

using namespace tailstream;

TEST_CASE("byte_stream::read validates arguments")
{
    memory_stream ms("abcdef");
    std::vector<unsigned char> buf(4);

    CHECK_THROWS_AS(ms.read(nullptr, 0, 0, 1), std::invalid_argument);
    CHECK_THROWS_AS(ms.read(buf, 2, 3), std::out_of_range);
    CHECK_THROWS_AS(ms.read(buf, 5, 0), std::out_of_range);
    CHECK(ms.read(buf, 4, 0) == 0);
    CHECK(ms.read(nullptr, 0, 0, 0) == 0);
    CHECK(ms.position() == 0);

    CHECK(ms.read(buf, 1, 3) == 3);
    CHECK(buf[1] == 'a');
    CHECK(buf[3] == 'c');
    CHECK(ms.position() == 3);
}

TEST_CASE("byte_stream::write validates arguments")
{
    memory_stream ms;
    std::vector<unsigned char> buf = {'x', 'y', 'z'};

    CHECK_THROWS_AS(ms.write(nullptr, 0, 0, 2), std::invalid_argument);
    CHECK_THROWS_AS(ms.write(buf, 1, 3), std::out_of_range);
    ms.write(buf, 1, 2);
    CHECK(ms.length() == 2);
}

TEST_CASE("to_string(seek_origin)")
{
    CHECK(std::string(to_string(seek_origin::begin)) == "begin");
    CHECK(std::string(to_string(seek_origin::current)) == "current");
    CHECK(std::string(to_string(seek_origin::end)) == "end");
}
