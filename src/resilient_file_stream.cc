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
 * @file resilient_file_stream.cc
 */

#include "resilient_file_stream.hh"

#include "base/fs_util.hh"
#include "base/tailstream_log.hh"
#include "config.h"
#include "fmt/format.h"

namespace tailstream {

resilient_file_stream::resilient_file_stream(
    std::filesystem::path path, std::shared_ptr<file_watcher> watcher)
    : rfs_path(std::move(path))
{
    if (watcher != nullptr) {
        this->rfs_subscription = watcher->subscribe(
            this->rfs_path,
            [this](watch_event evt) { this->on_watch_event(evt); });
    }
}

resilient_file_stream::~resilient_file_stream()
{
    this->close();
}

void
resilient_file_stream::check_open() const
{
    if (this->rfs_closed) {
        throw stream_closed(
            fmt::format(FMT_STRING("stream is closed: {}"), this->to_string()));
    }
}

bool
resilient_file_stream::bind()
{
    if (this->rfs_handle) {
        return true;
    }

    auto open_res = file_handle::open(this->rfs_path);
    if (open_res.isErr()) {
        auto err = open_res.unwrapErr();

        if (err.is_transient()) {
            log_trace("%s: unable to open -- %s",
                      this->rfs_path.c_str(),
                      err.to_string().c_str());
            return false;
        }

        log_error("%s: open failed -- %s",
                  this->rfs_path.c_str(),
                  err.to_string().c_str());
        throw io_exception(err);
    }

    this->rfs_handle = open_res.unwrap();
    log_debug("%s: bound to fd %d",
              this->rfs_path.c_str(),
              this->rfs_handle->get_fd());

    return true;
}

void
resilient_file_stream::unbind(const char* reason)
{
    if (this->rfs_handle) {
        log_debug("%s: unbound fd %d -- %s",
                  this->rfs_path.c_str(),
                  this->rfs_handle->get_fd(),
                  reason);
        this->rfs_handle = std::nullopt;
    }
}

void
resilient_file_stream::handle_error(const io_error& err)
{
    if (err.is_transient()) {
        this->unbind(tailstream::to_string(err.ie_kind));
        return;
    }

    log_error("%s: %s", this->rfs_path.c_str(), err.to_string().c_str());
    throw io_exception(err);
}

void
resilient_file_stream::check_after_empty_read()
{
    auto path_res = filesystem::stat_file(this->rfs_path);
    if (path_res.isErr()) {
        this->handle_error(path_res.unwrapErr());
        return;
    }

    auto fd_res = this->rfs_handle->stat_info();
    if (fd_res.isErr()) {
        this->handle_error(fd_res.unwrapErr());
        return;
    }

    auto path_st = path_res.unwrap();
    auto fd_st = fd_res.unwrap();
    if (!filesystem::is_same_file(path_st, fd_st)) {
        this->unbind("path refers to a different file");
        return;
    }

    auto pos_res = this->rfs_handle->position();
    if (pos_res.isErr()) {
        this->handle_error(pos_res.unwrapErr());
        return;
    }
    if (fd_st.st_size < pos_res.unwrap()) {
        this->unbind("file was truncated");
    }
}

size_t
resilient_file_stream::do_read(unsigned char* dst, size_t count)
{
    this->check_open();

    std::lock_guard<std::mutex> lg(this->rfs_mutex);

    if (!this->bind()) {
        return 0;
    }

    auto read_res = this->rfs_handle->read(dst, count);
    if (read_res.isErr()) {
        this->handle_error(read_res.unwrapErr());
        return 0;
    }

    auto retval = read_res.unwrap();
    if (retval == 0) {
        this->check_after_empty_read();
    }

    return retval;
}

void
resilient_file_stream::do_write(const unsigned char* src, size_t count)
{
    throw unsupported_operation(
        fmt::format(FMT_STRING("{} is read-only"), this->to_string()));
}

file_ssize_t
resilient_file_stream::length()
{
    this->check_open();

    std::lock_guard<std::mutex> lg(this->rfs_mutex);

    if (!this->bind()) {
        return 0;
    }

    auto len_res = this->rfs_handle->length();
    if (len_res.isErr()) {
        this->handle_error(len_res.unwrapErr());
        return 0;
    }

    return len_res.unwrap();
}

file_off_t
resilient_file_stream::position()
{
    this->check_open();

    std::lock_guard<std::mutex> lg(this->rfs_mutex);

    if (!this->bind()) {
        return 0;
    }

    auto pos_res = this->rfs_handle->position();
    if (pos_res.isErr()) {
        this->handle_error(pos_res.unwrapErr());
        return 0;
    }

    return pos_res.unwrap();
}

void
resilient_file_stream::set_position(file_off_t pos)
{
    if (pos < 0) {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("negative position: {}"), pos));
    }

    this->seek(pos, seek_origin::begin);
}

file_off_t
resilient_file_stream::seek(file_off_t offset, seek_origin origin)
{
    this->check_open();

    std::lock_guard<std::mutex> lg(this->rfs_mutex);

    if (!this->bind()) {
        if (origin == seek_origin::begin && offset < 0) {
            throw std::invalid_argument(
                fmt::format(FMT_STRING("negative position: {}"), offset));
        }
        return 0;
    }

    file_off_t base = 0;
    switch (origin) {
        case seek_origin::begin:
            break;
        case seek_origin::current: {
            auto pos_res = this->rfs_handle->position();

            if (pos_res.isErr()) {
                this->handle_error(pos_res.unwrapErr());
                return 0;
            }
            base = pos_res.unwrap();
            break;
        }
        case seek_origin::end: {
            auto len_res = this->rfs_handle->length();

            if (len_res.isErr()) {
                this->handle_error(len_res.unwrapErr());
                return 0;
            }
            base = len_res.unwrap();
            break;
        }
    }

    if (base + offset < 0) {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("seek to {} from {} ({}) is before the "
                                   "start of the file"),
                        offset,
                        tailstream::to_string(origin),
                        base));
    }

    auto seek_res = this->rfs_handle->seek(base + offset, seek_origin::begin);
    if (seek_res.isErr()) {
        this->handle_error(seek_res.unwrapErr());
        return 0;
    }

    return seek_res.unwrap();
}

void
resilient_file_stream::set_length(file_ssize_t len)
{
    throw unsupported_operation(
        fmt::format(FMT_STRING("{} is read-only"), this->to_string()));
}

void
resilient_file_stream::close()
{
    if (this->rfs_closed.exchange(true)) {
        return;
    }

    // A callback in progress holds the watcher's lock while it waits for
    // rfs_mutex, so the subscription has to go first.
    this->rfs_subscription.reset();

    std::lock_guard<std::mutex> lg(this->rfs_mutex);
    this->unbind("closed");
}

bool
resilient_file_stream::is_bound()
{
    std::lock_guard<std::mutex> lg(this->rfs_mutex);

    return this->rfs_handle.has_value();
}

std::string
resilient_file_stream::to_string() const
{
    return fmt::format(FMT_STRING("[SFS] {}"),
                       this->rfs_path.filename().string());
}

void
resilient_file_stream::on_watch_event(watch_event evt)
{
    std::lock_guard<std::mutex> lg(this->rfs_mutex);

    this->unbind(tailstream::to_string(evt));
}

}  // namespace tailstream
