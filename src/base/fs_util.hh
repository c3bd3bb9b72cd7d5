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

#ifndef tailstream_fs_util_hh
#define tailstream_fs_util_hh

#include <filesystem>
#include <string>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "auto_fd.hh"
#include "base/result.h"
#include "io_error.hh"

namespace tailstream {
namespace filesystem {

inline int
statp(const std::filesystem::path& path, struct stat* buf)
{
    return stat(path.c_str(), buf);
}

inline int
openp(const std::filesystem::path& path, int flags)
{
    return open(path.c_str(), flags);
}

Result<auto_fd, io_error> open_file(const std::filesystem::path& path,
                                    int flags);

Result<struct stat, io_error> stat_file(const std::filesystem::path& path);

Result<struct stat, io_error> stat_fd(int fd,
                                      const std::filesystem::path& path);

/**
 * @return True if both stat results describe the same inode on the same
 * device.
 */
inline bool
is_same_file(const struct stat& lhs, const struct stat& rhs)
{
    return lhs.st_dev == rhs.st_dev && lhs.st_ino == rhs.st_ino;
}

/**
 * Split a path into the directory that should be watched for changes and the
 * name of the entry in that directory.  Relative paths are resolved against
 * the current working directory.
 */
std::pair<std::filesystem::path, std::string> split_watch_path(
    const std::filesystem::path& path);

}  // namespace filesystem
}  // namespace tailstream

#endif
