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
 * @file isc.hh
 */

#ifndef tailstream_isc_hh
#define tailstream_isc_hh

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include "safe/safe.h"
#include "time_util.hh"

namespace isc {

struct msg {
    std::function<void()> m_callback;
};

inline msg
empty_msg()
{
    return {[]() {}};
}

class msg_port {
public:
    msg_port() = default;

    void send(msg&& m)
    {
        safe::WriteAccess<safe_message_list, std::unique_lock> writable_msgs(
            this->mp_messages);

        writable_msgs->emplace_back(std::move(m));
        this->sp_cond.notify_all();
    }

    template<class Rep, class Period>
    void process_for(const std::chrono::duration<Rep, Period>& rel_time)
    {
        std::deque<msg> tmp_msgs;

        {
            safe::WriteAccess<safe_message_list, std::unique_lock>
                writable_msgs(this->mp_messages);

            if (writable_msgs->empty() && rel_time.count() > 0) {
                this->sp_cond.wait_for(writable_msgs.lock, rel_time);
            }

            tmp_msgs.swap(*writable_msgs);
        }
        while (!tmp_msgs.empty()) {
            auto& m = tmp_msgs.front();

            m.m_callback();
            tmp_msgs.pop_front();
        }
    }

private:
    using message_list = std::deque<msg>;
    using safe_message_list = safe::Safe<message_list>;

    std::condition_variable sp_cond;
    safe_message_list mp_messages;
};

/**
 * A background thread that alternates between draining its message port and
 * running loop_body().  The time spent waiting on the port is given by
 * compute_timeout(), so a service can sleep until its next deadline and still
 * be woken early by a message.
 */
class service_base {
public:
    explicit service_base(std::string name) : s_name(std::move(name)) {}

    virtual ~service_base() = default;

    service_base(const service_base&) = delete;
    service_base& operator=(const service_base&) = delete;

    bool is_started() const { return this->s_started; }

    /**
     * Start the service thread.  A service whose loop has exited because of
     * an error is restarted.
     */
    void start();

    /**
     * Stop the loop and join the thread.  Must not be called from the service
     * thread itself.
     */
    void stop();

    /** Interrupt a wait in process_for() so the timeout is recomputed. */
    void wake() { this->s_port.send(empty_msg()); }

protected:
    virtual void* run();
    virtual void loop_body() {}
    /** Called on the service thread after the loop has exited. */
    virtual void stopped() {}
    virtual std::chrono::milliseconds compute_timeout(
        mstime_t current_time) const
    {
        using namespace std::literals::chrono_literals;

        return 1s;
    }

    const std::string s_name;
    std::mutex s_lifecycle_mutex;
    bool s_started{false};
    std::thread s_thread;
    std::atomic<bool> s_looping{true};
    msg_port s_port;
};

}  // namespace isc

#endif
