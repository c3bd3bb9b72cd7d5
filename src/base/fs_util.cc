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

#include "fs_util.hh"

#include <errno.h>

#include "config.h"
#include "tailstream_log.hh"

namespace tailstream {
namespace filesystem {

Result<auto_fd, io_error>
open_file(const std::filesystem::path& path, int flags)
{
    auto fd = openp(path, flags);

    if (fd == -1) {
        return Err(io_error::from_errno(errno, "open", path));
    }

    return Ok(auto_fd(fd));
}

Result<struct stat, io_error>
stat_file(const std::filesystem::path& path)
{
    struct stat retval;

    if (statp(path, &retval) == -1) {
        return Err(io_error::from_errno(errno, "stat", path));
    }

    return Ok(retval);
}

Result<struct stat, io_error>
stat_fd(int fd, const std::filesystem::path& path)
{
    struct stat retval;

    if (fstat(fd, &retval) == -1) {
        return Err(io_error::from_errno(errno, "fstat", path));
    }

    return Ok(retval);
}

std::pair<std::filesystem::path, std::string>
split_watch_path(const std::filesystem::path& path)
{
    std::error_code ec;
    auto abs_path = std::filesystem::absolute(path, ec);

    if (ec) {
        log_warning("unable to make path absolute: %s -- %s",
                    path.c_str(),
                    ec.message().c_str());
        abs_path = path;
    }
    abs_path = abs_path.lexically_normal();

    auto dir = abs_path.parent_path();
    if (dir.empty()) {
        dir = ".";
    }

    return std::make_pair(dir, abs_path.filename().string());
}

}  // namespace filesystem
}  // namespace tailstream
