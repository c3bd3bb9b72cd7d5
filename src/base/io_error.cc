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

#include "io_error.hh"

#include <errno.h>
#include <string.h>

#include "config.h"

namespace tailstream {

io_error::kind
io_error::classify(int err)
{
    switch (err) {
        case ENOENT:
        case ENOTDIR:
        case ESTALE:
        case ENXIO:
        case ENODEV:
            return kind::not_found;
        case EACCES:
        case EPERM:
            return kind::access_denied;
        default:
            return kind::fatal;
    }
}

io_error
io_error::from_errno(int err,
                     std::string operation,
                     std::filesystem::path path)
{
    io_error retval;

    retval.ie_errno = err;
    retval.ie_kind = classify(err);
    retval.ie_operation = std::move(operation);
    retval.ie_path = std::move(path);

    return retval;
}

std::string
io_error::to_string() const
{
    if (this->ie_path.empty()) {
        return fmt::format(FMT_STRING("{} failed ({}) -- {}"),
                           this->ie_operation,
                           tailstream::to_string(this->ie_kind),
                           strerror(this->ie_errno));
    }

    return fmt::format(FMT_STRING("{} failed for {} ({}) -- {}"),
                       this->ie_operation,
                       this->ie_path.string(),
                       tailstream::to_string(this->ie_kind),
                       strerror(this->ie_errno));
}

const char*
to_string(io_error::kind k)
{
    switch (k) {
        case io_error::kind::not_found:
            return "not found";
        case io_error::kind::access_denied:
            return "access denied";
        case io_error::kind::fatal:
            return "fatal";
    }

    return "unknown";
}

}  // namespace tailstream

auto
fmt::formatter<tailstream::io_error>::format(const tailstream::io_error& err,
                                             format_context& ctx) const
    -> decltype(ctx.out())
{
    return formatter<string_view>::format(err.to_string(), ctx);
}
