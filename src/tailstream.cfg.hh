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

#ifndef tailstream_cfg_hh
#define tailstream_cfg_hh

#include <chrono>
#include <optional>
#include <string>

#include <stddef.h>

namespace tailstream {

struct line_reader_config {
    static constexpr size_t DEFAULT_BLOCK_SIZE = 65535;

    std::string c_encoding{"UTF-8"};
    size_t c_block_size{DEFAULT_BLOCK_SIZE};
    /* Lines longer than this many code points are split into chunks. */
    std::optional<size_t> c_max_line_length;
};

struct tracking_config {
    std::chrono::milliseconds c_recheck_interval{std::chrono::seconds(1)};
};

struct watcher_config {
    /* How long the watcher thread blocks on inotify before checking for a
     * shutdown request. */
    std::chrono::milliseconds c_poll_timeout{250};
    /* Period of the stat(2) scan used when inotify is not available. */
    std::chrono::milliseconds c_stat_interval{500};
};

}  // namespace tailstream

#endif
