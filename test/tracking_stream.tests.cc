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
#include <thread>
#include <vector>

#include "tracking_stream.hh"

#include "config.h"
#include "doctest/doctest.h"
#include "memory_stream.hh"
#include "resilient_file_stream.hh"
#include "scoped_tmpdir.hh"

using namespace tailstream;
using namespace std::chrono_literals;

static tracking_config
fast_config()
{
    tracking_config retval;

    retval.c_recheck_interval = 20ms;

    return retval;
}

TEST_CASE("tracking_stream::notifies-once-per-change")
{
    auto* ms = new memory_stream("abc");
    tracking_stream ts(std::unique_ptr<byte_stream>(ms), fast_config());
    std::atomic<int> changes{0};

    ts.add_observer([&changes](tracking_stream& stream) { changes += 1; });
    ts.start_tracking();
    // the first check happens before start_tracking() returns
    CHECK(changes == 1);
    CHECK(ts.get_observed_length() == 3);
    CHECK(ts.is_tracking());

    std::this_thread::sleep_for(150ms);
    CHECK(changes == 1);

    ms->append("def");
    CHECK(wait_for([&changes]() { return changes == 2; }));
    std::this_thread::sleep_for(150ms);
    CHECK(changes == 2);
    CHECK(ts.get_observed_length() == 6);

    ms->set_length(2);
    CHECK(wait_for([&changes]() { return changes == 3; }));
    CHECK(ts.get_observed_length() == 2);

    ts.stop_tracking();
    CHECK_FALSE(ts.is_tracking());
}

TEST_CASE("tracking_stream::no-change-no-notification")
{
    auto* ms = new memory_stream();
    tracking_stream ts(std::unique_ptr<byte_stream>(ms), fast_config());
    int changes = 0;

    ts.add_observer([&changes](tracking_stream& stream) { changes += 1; });
    ts.start_tracking();
    CHECK(wait_for([ms]() { return ms->get_length_calls() >= 5; }));
    ts.stop_tracking();
    CHECK(changes == 0);
}

TEST_CASE("tracking_stream::already-started")
{
    tracking_stream ts(std::make_unique<memory_stream>("x"), fast_config());

    ts.start_tracking();
    CHECK_THROWS_AS(ts.start_tracking(), tracking_stream::already_started);
    ts.stop_tracking();
    ts.start_tracking();
    CHECK(ts.is_tracking());
}

TEST_CASE("tracking_stream::length-failure-is-retried")
{
    auto* ms = new memory_stream("12345");
    tracking_stream ts(std::unique_ptr<byte_stream>(ms), fast_config());
    std::atomic<int> changes{0};

    ts.add_observer([&changes](tracking_stream& stream) { changes += 1; });
    ms->set_fail_length(true);
    ts.start_tracking();
    CHECK(changes == 0);
    CHECK(wait_for([ms]() { return ms->get_length_calls() >= 3; }));
    CHECK(changes == 0);
    CHECK(ts.get_observed_length() == 0);

    ms->set_fail_length(false);
    CHECK(wait_for([&changes]() { return changes == 1; }));
    CHECK(ts.get_observed_length() == 5);
}

TEST_CASE("tracking_stream::timer-error-allows-restart")
{
    auto* ms = new memory_stream("abc");
    tracking_stream ts(std::unique_ptr<byte_stream>(ms), fast_config());
    std::atomic<int> changes{0};

    ts.add_observer([&changes](tracking_stream& stream) { changes += 1; });
    ts.start_tracking();
    CHECK(changes == 1);

    ms->set_break_length(true);
    CHECK(wait_for([&ts]() { return !ts.is_tracking(); }));

    ms->set_break_length(false);
    ms->append("def");
    ts.start_tracking();
    CHECK(ts.is_tracking());
    CHECK(changes == 2);

    auto calls = ms->get_length_calls();
    CHECK(wait_for([ms, calls]() { return ms->get_length_calls() > calls; }));
    ms->append("ghi");
    CHECK(wait_for([&changes]() { return changes == 3; }));
    CHECK(ts.get_observed_length() == 9);
}

TEST_CASE("tracking_stream::first-check-error")
{
    auto* ms = new memory_stream("abc");
    tracking_stream ts(std::unique_ptr<byte_stream>(ms), fast_config());
    std::atomic<int> changes{0};

    ts.add_observer([&changes](tracking_stream& stream) { changes += 1; });
    ms->set_break_length(true);
    CHECK_THROWS_AS(ts.start_tracking(), std::runtime_error);
    CHECK_FALSE(ts.is_tracking());
    CHECK(changes == 0);

    ms->set_break_length(false);
    ts.start_tracking();
    CHECK(ts.is_tracking());
    CHECK(changes == 1);

    ms->append("d");
    CHECK(wait_for([&changes]() { return changes == 2; }));
}

TEST_CASE("tracking_stream::stop")
{
    auto* ms = new memory_stream("abc");
    tracking_stream ts(std::unique_ptr<byte_stream>(ms), fast_config());
    std::atomic<int> changes{0};

    ts.add_observer([&changes](tracking_stream& stream) { changes += 1; });
    ts.start_tracking();
    ts.stop_tracking();
    std::this_thread::sleep_for(50ms);

    auto calls = ms->get_length_calls();
    ms->append("more");
    std::this_thread::sleep_for(150ms);
    CHECK(ms->get_length_calls() == calls);
    CHECK(changes == 1);
}

TEST_CASE("tracking_stream::remove-observer")
{
    auto* ms = new memory_stream();
    tracking_stream ts(std::unique_ptr<byte_stream>(ms), fast_config());
    std::atomic<int> first{0};
    std::atomic<int> second{0};

    auto first_id
        = ts.add_observer([&first](tracking_stream& stream) { first += 1; });
    ts.add_observer([&second](tracking_stream& stream) { second += 1; });
    ts.start_tracking();

    ms->append("a");
    CHECK(wait_for([&]() { return first == 1 && second == 1; }));

    ts.remove_observer(first_id);
    ms->append("b");
    CHECK(wait_for([&second]() { return second == 2; }));
    CHECK(first == 1);
}

TEST_CASE("tracking_stream::pass-through")
{
    auto* ms = new memory_stream("hello");
    tracking_stream ts(std::unique_ptr<byte_stream>(ms));
    std::vector<unsigned char> buf(5);

    CHECK(ts.get_config().c_recheck_interval == 1s);
    CHECK(ts.can_read());
    CHECK(ts.can_seek());
    CHECK(ts.can_write());
    CHECK(ts.length() == 5);
    CHECK(ts.read(buf, 0, 3) == 3);
    CHECK(ts.position() == 3);
    CHECK(ts.seek(1, seek_origin::begin) == 1);
    ts.set_position(4);
    CHECK(ms->position() == 4);
    ts.write(buf, 0, 2);
    CHECK(ts.length() == 6);
    ts.set_length(2);
    CHECK(ms->length() == 2);
    ts.flush();
    CHECK(ts.to_string() == "[TS] [MS]");
    CHECK(&ts.get_base_stream() == ms);
}

TEST_CASE("tracking_stream::close")
{
    auto* ms = new memory_stream("abc");
    tracking_stream ts(std::unique_ptr<byte_stream>(ms), fast_config());

    ts.start_tracking();
    ts.close();
    CHECK(ms->is_closed());
    CHECK_FALSE(ts.is_tracking());
    CHECK_THROWS_AS(ts.length(), stream_closed);
    CHECK_THROWS_AS(ts.start_tracking(), stream_closed);
    ts.close();
}

TEST_CASE("tracking_stream::invalid-arguments")
{
    CHECK_THROWS_AS(tracking_stream(nullptr), std::invalid_argument);

    tracking_config cfg;
    cfg.c_recheck_interval = 0ms;
    CHECK_THROWS_AS(tracking_stream(std::make_unique<memory_stream>(), cfg),
                    std::invalid_argument);
}

TEST_CASE("tracking_stream::follows-resilient-file")
{
    scoped_tmpdir tmp;
    auto path = tmp / "growing.log";
    auto rfs = std::make_unique<resilient_file_stream>(
        path, file_watcher::create());
    tracking_stream ts(std::move(rfs), fast_config());
    std::atomic<int> changes{0};

    ts.add_observer([&changes](tracking_stream& stream) { changes += 1; });
    ts.start_tracking();
    CHECK(changes == 0);

    write_file(path, "one\n");
    CHECK(wait_for([&changes]() { return changes == 1; }));
    write_file(path, "two\n", std::ios::app);
    CHECK(wait_for([&changes]() { return changes == 2; }));
    CHECK(ts.get_observed_length() == 8);

    std::filesystem::remove(path);
    CHECK(wait_for([&changes]() { return changes == 3; }));
    CHECK(ts.get_observed_length() == 0);
}
