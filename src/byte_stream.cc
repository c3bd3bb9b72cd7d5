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
 * @file byte_stream.cc
 */

#include "byte_stream.hh"

#include "config.h"
#include "fmt/format.h"

namespace tailstream {

static void
check_range(const void* buffer,
            size_t buffer_size,
            size_t offset,
            size_t count)
{
    if (buffer == nullptr && count > 0) {
        throw std::invalid_argument("buffer is null");
    }
    if (offset > buffer_size || count > buffer_size - offset) {
        throw std::out_of_range(fmt::format(
            FMT_STRING("range [{}, {}) does not fit in a buffer of {} bytes"),
            offset,
            offset + count,
            buffer_size));
    }
}

size_t
byte_stream::read(unsigned char* buffer,
                  size_t buffer_size,
                  size_t offset,
                  size_t count)
{
    check_range(buffer, buffer_size, offset, count);
    if (count == 0) {
        return 0;
    }

    return this->do_read(buffer + offset, count);
}

void
byte_stream::write(const unsigned char* buffer,
                   size_t buffer_size,
                   size_t offset,
                   size_t count)
{
    check_range(buffer, buffer_size, offset, count);

    this->do_write(buffer + offset, count);
}

const char*
to_string(seek_origin origin)
{
    switch (origin) {
        case seek_origin::begin:
            return "begin";
        case seek_origin::current:
            return "current";
        case seek_origin::end:
            return "end";
    }

    return "unknown";
}

}  // namespace tailstream
