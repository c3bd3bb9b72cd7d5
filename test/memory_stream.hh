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

#ifndef tailstream_test_memory_stream_hh
#define tailstream_test_memory_stream_hh

#include <algorithm>
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include <errno.h>

#include "base/io_error.hh"
#include "byte_stream.hh"

namespace tailstream {

/**
 * An in-memory stream that can be appended to from another thread and that
 * can be told to fail length() calls.
 */
class memory_stream : public byte_stream {
public:
    explicit memory_stream(std::string initial = {})
        : ms_data(initial.begin(), initial.end())
    {
    }

    void append(const std::string& str)
    {
        std::lock_guard<std::mutex> lg(this->ms_mutex);

        this->ms_data.insert(this->ms_data.end(), str.begin(), str.end());
    }

    void set_fail_length(bool fail) { this->ms_fail_length = fail; }

    /** Make length() throw an error that is not an io_exception. */
    void set_break_length(bool broken) { this->ms_break_length = broken; }

    size_t get_length_calls() const { return this->ms_length_calls; }

    bool is_closed() const { return this->ms_closed; }

    bool can_read() const override { return this->ms_readable; }
    bool can_seek() const override { return true; }
    bool can_write() const override { return true; }

    void set_readable(bool readable) { this->ms_readable = readable; }

    file_ssize_t length() override
    {
        this->check_open();
        this->ms_length_calls += 1;
        if (this->ms_fail_length) {
            throw io_exception(io_error::from_errno(EIO, "length"));
        }
        if (this->ms_break_length) {
            throw std::runtime_error("length is broken");
        }

        std::lock_guard<std::mutex> lg(this->ms_mutex);

        return this->ms_data.size();
    }

    file_off_t position() override
    {
        this->check_open();

        std::lock_guard<std::mutex> lg(this->ms_mutex);

        return this->ms_position;
    }

    void set_position(file_off_t pos) override
    {
        this->seek(pos, seek_origin::begin);
    }

    file_off_t seek(file_off_t offset, seek_origin origin) override
    {
        this->check_open();

        std::lock_guard<std::mutex> lg(this->ms_mutex);
        file_off_t base = 0;

        switch (origin) {
            case seek_origin::begin:
                break;
            case seek_origin::current:
                base = this->ms_position;
                break;
            case seek_origin::end:
                base = this->ms_data.size();
                break;
        }
        if (base + offset < 0) {
            throw std::invalid_argument("negative position");
        }
        this->ms_position = base + offset;

        return this->ms_position;
    }

    void set_length(file_ssize_t len) override
    {
        this->check_open();

        std::lock_guard<std::mutex> lg(this->ms_mutex);

        this->ms_data.resize(len);
    }

    void flush() override {}

    void close() override { this->ms_closed = true; }

    std::string to_string() const override { return "[MS]"; }

protected:
    size_t do_read(unsigned char* dst, size_t count) override
    {
        this->check_open();

        std::lock_guard<std::mutex> lg(this->ms_mutex);

        if (this->ms_position >= (file_off_t) this->ms_data.size()) {
            return 0;
        }

        auto avail = this->ms_data.size() - this->ms_position;
        auto retval = std::min(avail, count);

        std::copy(this->ms_data.begin() + this->ms_position,
                  this->ms_data.begin() + this->ms_position + retval,
                  dst);
        this->ms_position += retval;

        return retval;
    }

    void do_write(const unsigned char* src, size_t count) override
    {
        this->check_open();

        std::lock_guard<std::mutex> lg(this->ms_mutex);
        auto end = this->ms_position + count;

        if (end > this->ms_data.size()) {
            this->ms_data.resize(end);
        }
        std::copy(src, src + count, this->ms_data.begin() + this->ms_position);
        this->ms_position = end;
    }

private:
    void check_open() const
    {
        if (this->ms_closed) {
            throw stream_closed("memory stream is closed");
        }
    }

    std::mutex ms_mutex;
    std::vector<unsigned char> ms_data;
    file_off_t ms_position{0};
    std::atomic<bool> ms_fail_length{false};
    std::atomic<bool> ms_break_length{false};
    std::atomic<size_t> ms_length_calls{0};
    std::atomic<bool> ms_closed{false};
    bool ms_readable{true};
};

}  // namespace tailstream

#endif
