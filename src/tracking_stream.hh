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
 * @file tracking_stream.hh
 */

#ifndef tailstream_tracking_stream_hh
#define tailstream_tracking_stream_hh

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#include "base/isc.hh"
#include "byte_stream.hh"
#include "tailstream.cfg.hh"

namespace tailstream {

/**
 * A stream decorator that periodically checks the length of the wrapped
 * stream and notifies observers when it differs from the last length that
 * was seen.  All stream operations are passed through untouched.
 */
class tracking_stream : public byte_stream {
public:
    using observer_t = std::function<void(tracking_stream&)>;
    using observer_id = uint64_t;

    class already_started : public std::logic_error {
    public:
        already_started() : std::logic_error("tracking is already started") {}
    };

    explicit tracking_stream(std::unique_ptr<byte_stream> base,
                             tracking_config cfg = {});

    ~tracking_stream() override;

    tracking_stream(const tracking_stream&) = delete;
    tracking_stream& operator=(const tracking_stream&) = delete;

    bool can_read() const override { return this->ts_base->can_read(); }
    bool can_seek() const override { return this->ts_base->can_seek(); }
    bool can_write() const override { return this->ts_base->can_write(); }

    file_ssize_t length() override { return this->ts_base->length(); }

    file_off_t position() override { return this->ts_base->position(); }

    void set_position(file_off_t pos) override
    {
        this->ts_base->set_position(pos);
    }

    file_off_t seek(file_off_t offset, seek_origin origin) override
    {
        return this->ts_base->seek(offset, origin);
    }

    void set_length(file_ssize_t len) override
    {
        this->ts_base->set_length(len);
    }

    void flush() override { this->ts_base->flush(); }

    /**
     * Stop tracking, shut down the timer thread, and close the wrapped
     * stream.  Must not be called from an observer.
     */
    void close() override;

    std::string to_string() const override;

    /**
     * Run a check immediately and then every recheck interval until
     * stop_tracking() is called.
     *
     * @throws already_started If tracking is already active.
     */
    void start_tracking();

    void stop_tracking();

    bool is_tracking() const;

    /**
     * Register a callback that is called, on the thread running the check,
     * each time the length of the wrapped stream changes.
     */
    observer_id add_observer(observer_t obs);

    void remove_observer(observer_id id);

    byte_stream& get_base_stream() { return *this->ts_base; }

    /** @return The length seen by the last successful check. */
    file_ssize_t get_observed_length() const;

    const tracking_config& get_config() const { return this->ts_config; }

protected:
    size_t do_read(unsigned char* dst, size_t count) override
    {
        return this->ts_base->read(dst, count, 0, count);
    }

    void do_write(const unsigned char* src, size_t count) override
    {
        this->ts_base->write(src, count, 0, count);
    }

private:
    class poller : public isc::service_base {
    public:
        explicit poller(tracking_stream& ts)
            : isc::service_base("tracker"), p_stream(ts)
        {
        }

    protected:
        void loop_body() override;

        void stopped() override;

        std::chrono::milliseconds compute_timeout(
            mstime_t current_time) const override;

    private:
        tracking_stream& p_stream;
    };

    void run_cycle();
    void notify_observers();
    void disarm();

    std::unique_ptr<byte_stream> ts_base;
    const tracking_config ts_config;

    std::mutex ts_cycle_mutex;
    mutable std::mutex ts_state_mutex;
    bool ts_tracking{false};
    bool ts_armed{false};
    mstime_t ts_deadline{0};
    file_ssize_t ts_last_length{0};
    std::map<observer_id, observer_t> ts_observers;
    observer_id ts_next_observer_id{1};

    std::atomic<bool> ts_closed{false};
    poller ts_poller;
};

}  // namespace tailstream

#endif
