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
 * @file byte_stream.hh
 */

#ifndef tailstream_byte_stream_hh
#define tailstream_byte_stream_hh

#include <stdexcept>
#include <string>
#include <vector>

#include <stddef.h>
#include <stdint.h>

namespace tailstream {

using file_off_t = int64_t;
using file_ssize_t = int64_t;

enum class seek_origin {
    begin,
    current,
    end,
};

class unsupported_operation : public std::logic_error {
public:
    explicit unsupported_operation(const std::string& what)
        : std::logic_error(what)
    {
    }
};

class stream_closed : public std::logic_error {
public:
    explicit stream_closed(const std::string& what) : std::logic_error(what)
    {
    }
};

/**
 * A readable, optionally seekable and writable, sequence of bytes.  The
 * public read() and write() methods validate their arguments and then
 * delegate to the do_read() and do_write() hooks.
 */
class byte_stream {
public:
    virtual ~byte_stream() = default;

    virtual bool can_read() const = 0;
    virtual bool can_seek() const = 0;
    virtual bool can_write() const = 0;

    /**
     * Read up to `count` bytes into `buffer[offset, offset + count)`.
     *
     * @param buffer The destination, `buffer_size` bytes long.
     * @return The number of bytes read, zero at the end of the data.
     * @throws std::invalid_argument If buffer is null and count is non-zero.
     * @throws std::out_of_range If the range does not fit in the buffer.
     */
    size_t read(unsigned char* buffer,
                size_t buffer_size,
                size_t offset,
                size_t count);

    size_t read(std::vector<unsigned char>& buffer, size_t offset, size_t count)
    {
        return this->read(buffer.data(), buffer.size(), offset, count);
    }

    void write(const unsigned char* buffer,
               size_t buffer_size,
               size_t offset,
               size_t count);

    void write(const std::vector<unsigned char>& buffer,
               size_t offset,
               size_t count)
    {
        this->write(buffer.data(), buffer.size(), offset, count);
    }

    virtual file_ssize_t length() = 0;
    virtual file_off_t position() = 0;
    virtual void set_position(file_off_t pos) = 0;
    virtual file_off_t seek(file_off_t offset, seek_origin origin) = 0;
    virtual void set_length(file_ssize_t len) = 0;
    virtual void flush() = 0;

    /** Release any resources held by the stream.  Idempotent. */
    virtual void close() = 0;

    virtual std::string to_string() const = 0;

protected:
    virtual size_t do_read(unsigned char* dst, size_t count) = 0;
    virtual void do_write(const unsigned char* src, size_t count) = 0;
};

const char* to_string(seek_origin origin);

}  // namespace tailstream

#endif
