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
 * @file tracking_stream.cc
 */

#include <vector>

#include "tracking_stream.hh"

#include "base/io_error.hh"
#include "base/tailstream_log.hh"
#include "config.h"
#include "fmt/format.h"

namespace tailstream {

tracking_stream::tracking_stream(std::unique_ptr<byte_stream> base,
                                 tracking_config cfg)
    : ts_base(std::move(base)), ts_config(cfg), ts_poller(*this)
{
    if (this->ts_base == nullptr) {
        throw std::invalid_argument("tracking_stream requires a base stream");
    }
    if (this->ts_config.c_recheck_interval.count() <= 0) {
        throw std::invalid_argument("recheck interval must be positive");
    }
}

tracking_stream::~tracking_stream()
{
    this->close();
}

void
tracking_stream::start_tracking()
{
    {
        std::lock_guard<std::mutex> lg(this->ts_state_mutex);

        if (this->ts_tracking) {
            throw already_started();
        }
        if (this->ts_closed) {
            throw stream_closed(fmt::format(FMT_STRING("stream is closed: {}"),
                                            this->ts_base->to_string()));
        }
        this->ts_tracking = true;
    }

    log_debug("%s: start tracking", this->to_string().c_str());
    try {
        this->run_cycle();
    } catch (const std::exception& e) {
        log_error("%s: initial check failed -- %s",
                  this->to_string().c_str(),
                  e.what());
        this->disarm();
        throw;
    }
    this->ts_poller.start();
    this->ts_poller.wake();
}

void
tracking_stream::stop_tracking()
{
    log_debug("%s: stop tracking", this->ts_base->to_string().c_str());
    this->disarm();
}

void
tracking_stream::disarm()
{
    std::lock_guard<std::mutex> lg(this->ts_state_mutex);

    this->ts_tracking = false;
    this->ts_armed = false;
}

bool
tracking_stream::is_tracking() const
{
    std::lock_guard<std::mutex> lg(this->ts_state_mutex);

    return this->ts_tracking;
}

tracking_stream::observer_id
tracking_stream::add_observer(observer_t obs)
{
    std::lock_guard<std::mutex> lg(this->ts_state_mutex);
    auto retval = this->ts_next_observer_id++;

    this->ts_observers.emplace(retval, std::move(obs));

    return retval;
}

void
tracking_stream::remove_observer(observer_id id)
{
    std::lock_guard<std::mutex> lg(this->ts_state_mutex);

    this->ts_observers.erase(id);
}

file_ssize_t
tracking_stream::get_observed_length() const
{
    std::lock_guard<std::mutex> lg(this->ts_state_mutex);

    return this->ts_last_length;
}

void
tracking_stream::run_cycle()
{
    std::lock_guard<std::mutex> cycle_lg(this->ts_cycle_mutex);
    bool changed = false;

    {
        std::lock_guard<std::mutex> lg(this->ts_state_mutex);

        this->ts_armed = false;
    }

    try {
        auto current_length = this->ts_base->length();

        std::lock_guard<std::mutex> lg(this->ts_state_mutex);
        if (current_length != this->ts_last_length) {
            log_trace("%s: length changed %lld -> %lld",
                      this->ts_base->to_string().c_str(),
                      (long long) this->ts_last_length,
                      (long long) current_length);
            this->ts_last_length = current_length;
            changed = true;
        }
    } catch (const io_exception& e) {
        log_debug("%s: unable to get length -- %s",
                  this->ts_base->to_string().c_str(),
                  e.what());
    }

    if (changed) {
        this->notify_observers();
    }

    std::lock_guard<std::mutex> lg(this->ts_state_mutex);
    if (this->ts_tracking) {
        this->ts_armed = true;
        this->ts_deadline
            = getmonotime() + this->ts_config.c_recheck_interval.count();
    }
}

void
tracking_stream::notify_observers()
{
    std::vector<observer_t> observers;

    {
        std::lock_guard<std::mutex> lg(this->ts_state_mutex);

        for (const auto& pair : this->ts_observers) {
            observers.emplace_back(pair.second);
        }
    }

    for (auto& obs : observers) {
        try {
            obs(*this);
        } catch (const std::exception& e) {
            log_error("%s: observer failed -- %s",
                      this->ts_base->to_string().c_str(),
                      e.what());
        }
    }
}

void
tracking_stream::close()
{
    if (this->ts_closed.exchange(true)) {
        return;
    }

    this->stop_tracking();
    this->ts_poller.stop();
    this->ts_base->close();
}

std::string
tracking_stream::to_string() const
{
    return fmt::format(FMT_STRING("[TS] {}"), this->ts_base->to_string());
}

void
tracking_stream::poller::loop_body()
{
    {
        std::lock_guard<std::mutex> lg(this->p_stream.ts_state_mutex);

        if (!this->p_stream.ts_armed
            || getmonotime() < this->p_stream.ts_deadline)
        {
            return;
        }
    }

    this->p_stream.run_cycle();
}

void
tracking_stream::poller::stopped()
{
    // without the timer there is no tracking, allow start_tracking() again
    this->p_stream.disarm();
}

std::chrono::milliseconds
tracking_stream::poller::compute_timeout(mstime_t current_time) const
{
    std::lock_guard<std::mutex> lg(this->p_stream.ts_state_mutex);

    if (!this->p_stream.ts_armed) {
        return this->p_stream.ts_config.c_recheck_interval;
    }
    if (this->p_stream.ts_deadline <= current_time) {
        return std::chrono::milliseconds(0);
    }

    return std::chrono::milliseconds(this->p_stream.ts_deadline
                                     - current_time);
}

}  // namespace tailstream
