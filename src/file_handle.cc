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
 * @file file_handle.cc
 */

#include "file_handle.hh"

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include "base/fs_util.hh"
#include "config.h"

namespace tailstream {

Result<file_handle, io_error>
file_handle::open(const std::filesystem::path& path)
{
    auto open_res = filesystem::open_file(path, O_RDONLY | O_CLOEXEC);

    if (open_res.isErr()) {
        return Err(open_res.unwrapErr());
    }

    return Ok(file_handle(open_res.unwrap(), path));
}

Result<size_t, io_error>
file_handle::read(unsigned char* dst, size_t count)
{
    while (true) {
        auto rc = ::read(this->fh_fd, dst, count);

        if (rc >= 0) {
            return Ok(static_cast<size_t>(rc));
        }
        if (errno != EINTR) {
            return Err(io_error::from_errno(errno, "read", this->fh_path));
        }
    }
}

Result<file_off_t, io_error>
file_handle::seek(file_off_t offset, seek_origin origin)
{
    int whence = SEEK_SET;

    switch (origin) {
        case seek_origin::begin:
            whence = SEEK_SET;
            break;
        case seek_origin::current:
            whence = SEEK_CUR;
            break;
        case seek_origin::end:
            whence = SEEK_END;
            break;
    }

    auto rc = lseek(this->fh_fd, offset, whence);
    if (rc == -1) {
        return Err(io_error::from_errno(errno, "lseek", this->fh_path));
    }

    return Ok(static_cast<file_off_t>(rc));
}

Result<file_off_t, io_error>
file_handle::position() const
{
    auto rc = lseek(this->fh_fd, 0, SEEK_CUR);

    if (rc == -1) {
        return Err(io_error::from_errno(errno, "lseek", this->fh_path));
    }

    return Ok(static_cast<file_off_t>(rc));
}

Result<file_ssize_t, io_error>
file_handle::length() const
{
    auto stat_res = this->stat_info();

    if (stat_res.isErr()) {
        return Err(stat_res.unwrapErr());
    }

    return Ok(static_cast<file_ssize_t>(stat_res.unwrap().st_size));
}

Result<struct stat, io_error>
file_handle::stat_info() const
{
    return filesystem::stat_fd(this->fh_fd, this->fh_path);
}

}  // namespace tailstream
