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
 * @file resilient_file_stream.hh
 */

#ifndef tailstream_resilient_file_stream_hh
#define tailstream_resilient_file_stream_hh

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "byte_stream.hh"
#include "file_handle.hh"
#include "file_watcher.hh"

namespace tailstream {

/**
 * A read-only stream over a path whose file may be deleted and recreated
 * while the stream is in use.  The file is opened on demand and the
 * descriptor is dropped whenever the watcher reports that the path was
 * created or deleted, or when the file turns out to be missing, inaccessible,
 * replaced, or truncated.  While no file can be opened, reads return zero
 * bytes and the length and position are reported as zero.
 */
class resilient_file_stream : public byte_stream {
public:
    explicit resilient_file_stream(
        std::filesystem::path path,
        std::shared_ptr<file_watcher> watcher = file_watcher::shared());

    ~resilient_file_stream() override;

    resilient_file_stream(const resilient_file_stream&) = delete;
    resilient_file_stream& operator=(const resilient_file_stream&) = delete;

    bool can_read() const override { return true; }
    bool can_seek() const override { return true; }
    bool can_write() const override { return false; }

    file_ssize_t length() override;
    file_off_t position() override;
    void set_position(file_off_t pos) override;
    file_off_t seek(file_off_t offset, seek_origin origin) override;
    void set_length(file_ssize_t len) override;
    void flush() override {}
    void close() override;

    std::string to_string() const override;

    const std::filesystem::path& get_path() const { return this->rfs_path; }

    /** @return True if a descriptor for the file is currently open. */
    bool is_bound();

    bool is_closed() const { return this->rfs_closed; }

protected:
    size_t do_read(unsigned char* dst, size_t count) override;
    void do_write(const unsigned char* src, size_t count) override;

private:
    void check_open() const;

    /**
     * Open the file if it is not already open.  Must be called with
     * rfs_mutex held.
     *
     * @return True if a descriptor is available.
     */
    bool bind();

    void unbind(const char* reason);

    /**
     * Deal with an error from the open descriptor.  Missing and inaccessible
     * files unbind the stream, anything else is thrown.
     */
    void handle_error(const io_error& err);

    /**
     * Called after a read returned no data to check whether the file that is
     * open is still the one at the path and still covers the read offset.
     */
    void check_after_empty_read();

    void on_watch_event(watch_event evt);

    const std::filesystem::path rfs_path;
    std::mutex rfs_mutex;
    std::optional<file_handle> rfs_handle;
    file_watcher::subscription rfs_subscription;
    std::atomic<bool> rfs_closed{false};
};

}  // namespace tailstream

#endif
