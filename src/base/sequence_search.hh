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
 *
 * @file sequence_search.hh
 */

#ifndef tailstream_sequence_search_hh
#define tailstream_sequence_search_hh

#include <algorithm>
#include <iterator>

#include <sys/types.h>

namespace tailstream {
namespace sequence {

/**
 * Binary search over an ascending range.
 *
 * @param values The sorted values.  Behavior for unsorted input is not
 *   defined.
 * @param needle The value to look for.
 * @return The index of the greatest element that is less than or equal to the
 *   needle, or -1 if the range is empty or the needle is less than the first
 *   element.
 */
template<typename C, typename T>
ssize_t
binary_search_floor(const C& values, const T& needle)
{
    auto first = std::begin(values);
    auto last = std::end(values);

    if (first == last || needle < *first) {
        return -1;
    }

    auto iter = std::upper_bound(first, last, needle);

    return std::distance(first, iter) - 1;
}

template<typename C, typename T>
bool
try_find_value(const C& values, const T& needle, ssize_t& index_out)
{
    index_out = binary_search_floor(values, needle);

    return index_out >= 0;
}

namespace details {

template<typename C, typename P>
bool
matches_at(const C& buffer, size_t pos, const P& pattern)
{
    if (std::size(pattern) > std::size(buffer) - pos) {
        return false;
    }

    for (size_t lpc = 0; lpc < std::size(pattern); lpc++) {
        if (!(buffer[pos + lpc] == pattern[lpc])) {
            return false;
        }
    }

    return true;
}

template<typename C, typename P>
bool
is_searchable(const C& buffer, const P& pattern, size_t from)
{
    return !(std::size(buffer) == 0 || std::size(pattern) == 0
             || std::size(pattern) > std::size(buffer)
             || from > std::size(buffer));
}

}  // namespace details

/**
 * Brute-force search for the first occurrence of a sub-sequence, scanning
 * left-to-right starting at the given offset.
 *
 * @return The index of the start of the match or -1.
 */
template<typename C, typename P>
ssize_t
find_first(const C& buffer, const P& pattern, size_t from = 0)
{
    if (!details::is_searchable(buffer, pattern, from)) {
        return -1;
    }

    for (size_t lpc = from; lpc < std::size(buffer); lpc++) {
        if (details::matches_at(buffer, lpc, pattern)) {
            return lpc;
        }
    }

    return -1;
}

/**
 * Brute-force search for the last occurrence of a sub-sequence, scanning
 * right-to-left from the given offset down to zero.  Only matches that fit
 * entirely within the buffer are reported.
 *
 * @return The index of the start of the match or -1.
 */
template<typename C, typename P>
ssize_t
find_last(const C& buffer, const P& pattern, size_t from)
{
    if (!details::is_searchable(buffer, pattern, from)) {
        return -1;
    }

    for (auto lpc = static_cast<ssize_t>(from); lpc >= 0; lpc--) {
        if (static_cast<size_t>(lpc) < std::size(buffer)
            && details::matches_at(buffer, lpc, pattern))
        {
            return lpc;
        }
    }

    return -1;
}

template<typename C, typename P>
ssize_t
find_last(const C& buffer, const P& pattern)
{
    if (std::size(buffer) == 0) {
        return -1;
    }

    return find_last(buffer, pattern, std::size(buffer) - 1);
}

template<typename C, typename P>
bool
try_find_first(const C& buffer,
               const P& pattern,
               size_t from,
               ssize_t& index_out)
{
    index_out = find_first(buffer, pattern, from);

    return index_out >= 0;
}

template<typename C, typename P>
bool
try_find_last(const C& buffer,
              const P& pattern,
              size_t from,
              ssize_t& index_out)
{
    index_out = find_last(buffer, pattern, from);

    return index_out >= 0;
}

}  // namespace sequence
}  // namespace tailstream

#endif
