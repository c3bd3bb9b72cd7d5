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

#include <stdexcept>
#include <string>
#include <vector>

#include "base/text_encoding.hh"

#include "config.h"
#include "doctest/doctest.h"

using namespace tailstream;

TEST_CASE("text_encoding::line_terminator")
{
    {
        text_encoding te;

        CHECK(te.get_name() == "UTF-8");
        CHECK(te.get_line_terminator()
              == std::vector<unsigned char>{'\n'});
    }
    {
        text_encoding te("UTF-16LE");

        CHECK(te.get_line_terminator()
              == std::vector<unsigned char>{'\n', 0});
    }
    {
        text_encoding te("UTF-16BE");

        CHECK(te.get_line_terminator()
              == std::vector<unsigned char>{0, '\n'});
    }
    {
        text_encoding te("UTF-32LE");

        CHECK(te.get_line_terminator()
              == std::vector<unsigned char>{'\n', 0, 0, 0});
    }
}

TEST_CASE("text_encoding::unknown")
{
    CHECK_THROWS_AS(text_encoding("NOT-A-REAL-ENCODING-42"),
                    std::invalid_argument);
}

TEST_CASE("text_encoding::decode")
{
    SUBCASE("utf-16le")
    {
        text_encoding te("UTF-16LE");
        auto bytes = te.encode("h\xc3\xa9llo");

        CHECK(bytes.size() == 10);
        CHECK(te.decode(bytes.data(), bytes.size()) == "h\xc3\xa9llo");
    }

    SUBCASE("latin1")
    {
        text_encoding te("ISO-8859-1");
        unsigned char bytes[] = {'c', 'a', 'f', 0xe9};

        CHECK(te.decode(bytes, sizeof(bytes)) == "caf\xc3\xa9");
    }

    SUBCASE("malformed utf-8 is replaced")
    {
        text_encoding te;
        unsigned char bytes[] = {'a', 0xff, 'b'};

        CHECK(te.decode(bytes, sizeof(bytes)) == "a\xef\xbf\xbd"
                                                 "b");
    }

    SUBCASE("truncated sequence at the end is replaced")
    {
        text_encoding te;
        unsigned char bytes[] = {'a', 0xc3};

        CHECK(te.decode(bytes, sizeof(bytes)) == "a\xef\xbf\xbd");
    }

    SUBCASE("empty")
    {
        text_encoding te;

        CHECK(te.decode(nullptr, 0).empty());
    }
}

TEST_CASE("text_encoding::utf8 helpers")
{
    std::string str = "a\xc3\xa9z\xe2\x82\xac";

    CHECK(text_encoding::utf8_length(str) == 4);
    CHECK(text_encoding::utf8_byte_index(str, 0) == 0);
    CHECK(text_encoding::utf8_byte_index(str, 1) == 1);
    CHECK(text_encoding::utf8_byte_index(str, 2) == 3);
    CHECK(text_encoding::utf8_byte_index(str, 3) == 4);
    CHECK(text_encoding::utf8_byte_index(str, 4) == str.size());
    CHECK(text_encoding::utf8_byte_index(str, 100) == str.size());
}
