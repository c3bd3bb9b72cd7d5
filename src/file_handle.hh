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
 * @file file_handle.hh
 */

#ifndef tailstream_file_handle_hh
#define tailstream_file_handle_hh

#include <filesystem>

#include <sys/stat.h>

#include "base/auto_fd.hh"
#include "base/io_error.hh"
#include "base/result.h"
#include "byte_stream.hh"

namespace tailstream {

/**
 * A read-only, seekable open file.  Every operation reports failures as an
 * io_error so callers can decide which kinds of failure to tolerate.
 */
class file_handle {
public:
    /**
     * Open the file for reading.  The descriptor does not prevent other
     * processes from writing, truncating, or unlinking the file.
     */
    static Result<file_handle, io_error> open(
        const std::filesystem::path& path);

    file_handle(file_handle&& other) noexcept = default;
    file_handle& operator=(file_handle&& other) noexcept = default;

    const std::filesystem::path& get_path() const { return this->fh_path; }

    int get_fd() const { return this->fh_fd.get(); }

    /** Read at the current offset and advance it. */
    Result<size_t, io_error> read(unsigned char* dst, size_t count);

    Result<file_off_t, io_error> seek(file_off_t offset, seek_origin origin);

    Result<file_off_t, io_error> position() const;

    Result<file_ssize_t, io_error> length() const;

    Result<struct stat, io_error> stat_info() const;

private:
    file_handle(auto_fd fd, std::filesystem::path path)
        : fh_fd(std::move(fd)), fh_path(std::move(path))
    {
    }

    auto_fd fh_fd;
    std::filesystem::path fh_path;
};

}  // namespace tailstream

#endif
