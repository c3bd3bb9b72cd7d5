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

#ifndef tailstream_io_error_hh
#define tailstream_io_error_hh

#include <filesystem>
#include <stdexcept>
#include <string>

#include "fmt/format.h"

namespace tailstream {

/**
 * The outcome of a failed system call, classified by whether the failure
 * means "the file is not there right now" or something worse.
 */
struct io_error {
    enum class kind {
        not_found,
        access_denied,
        fatal,
    };

    static kind classify(int err);

    static io_error from_errno(int err,
                               std::string operation,
                               std::filesystem::path path = {});

    bool is_transient() const { return this->ie_kind != kind::fatal; }

    std::string to_string() const;

    int ie_errno{0};
    kind ie_kind{kind::fatal};
    std::string ie_operation;
    std::filesystem::path ie_path;
};

const char* to_string(io_error::kind k);

class io_exception : public std::runtime_error {
public:
    explicit io_exception(io_error err)
        : std::runtime_error(err.to_string()), ie_error(std::move(err))
    {
    }

    const io_error& get_error() const { return this->ie_error; }

private:
    io_error ie_error;
};

}  // namespace tailstream

template<>
struct fmt::formatter<tailstream::io_error> : formatter<string_view> {
    auto format(const tailstream::io_error& err, format_context& ctx) const
        -> decltype(ctx.out());
};

#endif
