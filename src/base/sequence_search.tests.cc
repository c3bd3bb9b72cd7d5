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

#include <array>
#include <string>
#include <vector>

#include "base/sequence_search.hh"

#include "config.h"
#include "doctest/doctest.h"

using namespace tailstream;

TEST_CASE("sequence::binary_search_floor")
{
    std::vector<int> empty;
    std::vector<int> values = {10, 20, 30, 40};

    CHECK(sequence::binary_search_floor(empty, 5) == -1);
    CHECK(sequence::binary_search_floor(values, 5) == -1);
    CHECK(sequence::binary_search_floor(values, 10) == 0);
    CHECK(sequence::binary_search_floor(values, 15) == 0);
    CHECK(sequence::binary_search_floor(values, 30) == 2);
    CHECK(sequence::binary_search_floor(values, 39) == 2);
    CHECK(sequence::binary_search_floor(values, 40) == 3);
    CHECK(sequence::binary_search_floor(values, 1000) == 3);

    ssize_t index = 0;
    CHECK_FALSE(sequence::try_find_value(values, 9, index));
    CHECK(index == -1);
    CHECK(sequence::try_find_value(values, 25, index));
    CHECK(index == 1);
}

TEST_CASE("sequence::binary_search_floor duplicates")
{
    std::vector<std::string> values = {"a", "b", "b", "d"};

    CHECK(sequence::binary_search_floor(values, std::string("b")) == 2);
    CHECK(sequence::binary_search_floor(values, std::string("c")) == 2);
    CHECK(sequence::binary_search_floor(values, std::string("0")) == -1);
}

TEST_CASE("sequence::find_first")
{
    std::string hay = "abc\r\ndef\r\n";
    std::string crlf = "\r\n";

    CHECK(sequence::find_first(hay, crlf, 0) == 3);
    CHECK(sequence::find_first(hay, crlf, 3) == 3);
    CHECK(sequence::find_first(hay, crlf, 4) == 8);
    CHECK(sequence::find_first(hay, crlf, 9) == -1);
    CHECK(sequence::find_first(hay, crlf, hay.size()) == -1);
    CHECK(sequence::find_first(hay, crlf, hay.size() + 1) == -1);
    CHECK(sequence::find_first(hay, std::string("xyz"), 0) == -1);

    SUBCASE("degenerate inputs")
    {
        CHECK(sequence::find_first(std::string(), crlf, 0) == -1);
        CHECK(sequence::find_first(hay, std::string(), 0) == -1);
        CHECK(sequence::find_first(std::string("a"), std::string("ab"), 0)
              == -1);
    }

    SUBCASE("match at the very end")
    {
        std::vector<unsigned char> buf = {1, 2, 3, 4};
        std::array<unsigned char, 2> pat = {3, 4};

        CHECK(sequence::find_first(buf, pat, 0) == 2);
    }

    SUBCASE("partial match at the end is not a match")
    {
        std::vector<unsigned char> buf = {1, 2, 3};
        std::array<unsigned char, 2> pat = {3, 4};

        CHECK(sequence::find_first(buf, pat, 0) == -1);
    }
}

TEST_CASE("sequence::find_last")
{
    std::string hay = "abc\r\ndef\r\n";
    std::string crlf = "\r\n";

    CHECK(sequence::find_last(hay, crlf) == 8);
    CHECK(sequence::find_last(hay, crlf, 7) == 3);
    CHECK(sequence::find_last(hay, crlf, 3) == 3);
    CHECK(sequence::find_last(hay, crlf, 2) == -1);
    CHECK(sequence::find_last(hay, crlf, hay.size()) == 8);
    CHECK(sequence::find_last(hay, crlf, hay.size() + 1) == -1);
    CHECK(sequence::find_last(std::string(), crlf) == -1);

    ssize_t index = 0;
    CHECK(sequence::try_find_last(hay, crlf, 7, index));
    CHECK(index == 3);
    CHECK(sequence::try_find_first(hay, crlf, 4, index));
    CHECK(index == 8);
}

TEST_CASE("sequence::single occurrence agrees")
{
    std::vector<std::string> hays = {
        "\n",
        "abc\n",
        "\nabc",
        "ab\ncd",
    };
    std::string nl = "\n";

    for (const auto& hay : hays) {
        auto first = sequence::find_first(hay, nl, 0);
        auto last = sequence::find_last(hay, nl);

        CHECK(first >= 0);
        CHECK(first == last);
        CHECK(hay.find(nl) == static_cast<size_t>(first));
    }
}
