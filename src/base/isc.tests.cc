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

#include <atomic>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <thread>

#include "base/isc.hh"

#include "config.h"
#include "doctest/doctest.h"

using namespace std::chrono_literals;

namespace {

class counting_service : public isc::service_base {
public:
    counting_service() : isc::service_base("counter") {}

    ~counting_service() override { this->stop(); }

    std::atomic<int> cs_loops{0};
    std::atomic<int> cs_stops{0};
    std::atomic<bool> cs_fail{false};

protected:
    void loop_body() override
    {
        this->cs_loops += 1;
        if (this->cs_fail) {
            throw std::runtime_error("loop failed");
        }
    }

    void stopped() override { this->cs_stops += 1; }

    std::chrono::milliseconds compute_timeout(
        mstime_t current_time) const override
    {
        return 5ms;
    }
};

bool
wait_until(const std::function<bool()>& pred)
{
    for (int lpc = 0; lpc < 500; lpc++) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(10ms);
    }
    return false;
}

}  // namespace

TEST_CASE("isc::service_base::restart-after-failure")
{
    counting_service cs;

    cs.cs_fail = true;
    cs.start();
    CHECK(cs.is_started());
    CHECK(wait_until([&cs]() { return cs.cs_stops == 1; }));

    cs.cs_fail = false;
    auto loops = cs.cs_loops.load();
    cs.start();
    CHECK(wait_until([&cs, loops]() { return cs.cs_loops > loops + 2; }));
    CHECK(cs.cs_stops == 1);

    cs.stop();
    CHECK_FALSE(cs.is_started());
    CHECK(cs.cs_stops == 2);
}

TEST_CASE("isc::service_base::wake")
{
    counting_service cs;

    cs.start();
    cs.start();
    cs.wake();
    CHECK(wait_until([&cs]() { return cs.cs_loops > 0; }));
    cs.stop();
    cs.stop();
    CHECK(cs.cs_stops == 1);
}
