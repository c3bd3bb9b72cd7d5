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
#include <mutex>
#include <thread>
#include <vector>

#include "file_watcher.hh"

#include "config.h"
#include "doctest/doctest.h"
#include "scoped_tmpdir.hh"

using namespace tailstream;
using namespace std::chrono_literals;

namespace {

struct event_log {
    void add(watch_event evt)
    {
        std::lock_guard<std::mutex> lg(this->el_mutex);

        this->el_events.emplace_back(evt);
    }

    bool contains(watch_event evt)
    {
        std::lock_guard<std::mutex> lg(this->el_mutex);

        for (const auto& seen : this->el_events) {
            if (seen == evt) {
                return true;
            }
        }
        return false;
    }

    size_t size()
    {
        std::lock_guard<std::mutex> lg(this->el_mutex);

        return this->el_events.size();
    }

    std::mutex el_mutex;
    std::vector<watch_event> el_events;
};

}  // namespace

TEST_CASE("file_watcher::created-and-deleted")
{
    scoped_tmpdir tmp;
    auto fw = file_watcher::create();
    event_log events;
    event_log others;

    auto sub = fw->subscribe(tmp / "target.log",
                             [&events](watch_event evt) { events.add(evt); });
    auto other_sub = fw->subscribe(
        tmp / "other.log", [&others](watch_event evt) { others.add(evt); });

    CHECK(sub.is_active());
    CHECK(fw->subscription_count() == 2);

    write_file(tmp / "target.log", "x");
    CHECK(wait_for([&events]() { return events.contains(watch_event::created); }));

    std::filesystem::remove(tmp / "target.log");
    CHECK(wait_for([&events]() { return events.contains(watch_event::deleted); }));

    std::this_thread::sleep_for(100ms);
    CHECK(others.size() == 0);
}

TEST_CASE("file_watcher::release-stops-callbacks")
{
    scoped_tmpdir tmp;
    auto fw = file_watcher::create();
    event_log events;

    auto sub = fw->subscribe(tmp / "target.log",
                             [&events](watch_event evt) { events.add(evt); });
    sub.reset();
    CHECK_FALSE(sub.has_value());
    CHECK_FALSE(sub.is_active());
    CHECK(fw->subscription_count() == 0);

    write_file(tmp / "target.log", "x");
    std::this_thread::sleep_for(200ms);
    CHECK(events.size() == 0);
}

TEST_CASE("file_watcher::moved-subscription")
{
    scoped_tmpdir tmp;
    auto fw = file_watcher::create();
    std::atomic<int> count{0};

    file_watcher::subscription outer;
    {
        auto inner = fw->subscribe(tmp / "a.log",
                                   [&count](watch_event evt) { count += 1; });
        outer = std::move(inner);
        CHECK_FALSE(inner.has_value());
    }
    CHECK(outer.is_active());
    CHECK(fw->subscription_count() == 1);

    write_file(tmp / "a.log", "a");
    CHECK(wait_for([&count]() { return count >= 1; }));
}

TEST_CASE("file_watcher::missing-directory")
{
    scoped_tmpdir tmp;
    auto fw = file_watcher::create();

    auto sub = fw->subscribe(tmp / "nope" / "a.log", [](watch_event evt) {});
    if (fw->uses_inotify()) {
        CHECK_FALSE(sub.is_active());
    }
    CHECK(fw->subscription_count() == 1);
}

TEST_CASE("file_watcher::custom-config")
{
    scoped_tmpdir tmp;
    watcher_config cfg;

    cfg.c_stat_interval = 20ms;

    auto fw = file_watcher::create(cfg);
    event_log events;

    auto sub = fw->subscribe(tmp / "polled.log",
                             [&events](watch_event evt) { events.add(evt); });

    write_file(tmp / "polled.log", "data");
    CHECK(wait_for([&events]() { return events.contains(watch_event::created); }));
    std::filesystem::remove(tmp / "polled.log");
    CHECK(wait_for([&events]() { return events.contains(watch_event::deleted); }));
}

TEST_CASE("file_watcher::shared")
{
    auto fw1 = file_watcher::shared();
    auto fw2 = file_watcher::shared();

    CHECK(fw1 == fw2);
    CHECK(fw1->is_started());
}

TEST_CASE("to_string(watch_event)")
{
    CHECK(std::string(to_string(watch_event::created)) == "created");
    CHECK(std::string(to_string(watch_event::deleted)) == "deleted");
}
