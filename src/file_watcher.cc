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
 * @file file_watcher.cc
 */

#include <vector>

#include "file_watcher.hh"

#include <errno.h>
#include <limits.h>
#include <poll.h>
#include <string.h>
#include <unistd.h>

#include "base/fs_util.hh"
#include "base/tailstream_log.hh"
#include "config.h"

#ifdef HAVE_SYS_INOTIFY_H
#    include <sys/inotify.h>
#endif

namespace tailstream {

const char*
to_string(watch_event evt)
{
    switch (evt) {
        case watch_event::created:
            return "created";
        case watch_event::deleted:
            return "deleted";
    }

    return "unknown";
}

static std::mutex SHARED_MUTEX;
static std::weak_ptr<file_watcher> SHARED_WATCHER;
static watcher_config DEFAULT_CONFIG;

std::shared_ptr<file_watcher>
file_watcher::shared()
{
    std::lock_guard<std::mutex> lg(SHARED_MUTEX);
    auto retval = SHARED_WATCHER.lock();

    if (retval == nullptr) {
        retval = create(DEFAULT_CONFIG);
        SHARED_WATCHER = retval;
    }

    return retval;
}

void
file_watcher::set_default_config(const watcher_config& cfg)
{
    std::lock_guard<std::mutex> lg(SHARED_MUTEX);

    DEFAULT_CONFIG = cfg;
}

std::shared_ptr<file_watcher>
file_watcher::create(watcher_config cfg)
{
    std::shared_ptr<file_watcher> retval(new file_watcher(cfg));

    retval->start();

    return retval;
}

file_watcher::file_watcher(watcher_config cfg)
    : isc::service_base("file_watcher"), fw_config(cfg)
{
#ifdef HAVE_SYS_INOTIFY_H
    this->fw_inotify_fd.reset(inotify_init1(IN_NONBLOCK | IN_CLOEXEC));
    if (!this->fw_inotify_fd.has_value()) {
        log_warning("inotify_init1() failed, falling back to polling -- %s",
                    strerror(errno));
    }
#endif
}

file_watcher::~file_watcher()
{
    this->stop();
}

bool
file_watcher::subscription::is_active() const
{
    if (this->s_watcher == nullptr) {
        return false;
    }

    return this->s_watcher->is_subscription_active(this->s_id);
}

void
file_watcher::subscription::reset()
{
    if (this->s_watcher != nullptr) {
        this->s_watcher->unsubscribe(this->s_id);
        this->s_watcher.reset();
        this->s_id = 0;
    }
}

file_watcher::subscription
file_watcher::subscribe(const std::filesystem::path& path, callback_t cb)
{
    auto split = filesystem::split_watch_path(path);
    std::lock_guard<std::mutex> lg(this->fw_mutex);
    auto id = this->fw_next_id++;
    auto& ent = this->fw_entries[id];

    ent.e_dir = split.first;
    ent.e_name = split.second;
    ent.e_callback = std::move(cb);
    if (this->uses_inotify()) {
        ent.e_active = this->add_dir_watch(ent.e_dir);
    } else {
        auto stat_res = filesystem::stat_file(ent.e_dir / ent.e_name);

        if (stat_res.isOk()) {
            ent.e_last_stat = stat_res.unwrap();
        }
        ent.e_active = true;
    }
    log_debug("subscribed %llu to %s in %s (active=%d)",
              (unsigned long long) id,
              ent.e_name.c_str(),
              ent.e_dir.c_str(),
              ent.e_active);

    return subscription(this->shared_from_this(), id);
}

size_t
file_watcher::subscription_count() const
{
    std::lock_guard<std::mutex> lg(this->fw_mutex);

    return this->fw_entries.size();
}

bool
file_watcher::is_subscription_active(uint64_t id) const
{
    std::lock_guard<std::mutex> lg(this->fw_mutex);
    auto iter = this->fw_entries.find(id);

    return iter != this->fw_entries.end() && iter->second.e_active;
}

void
file_watcher::unsubscribe(uint64_t id)
{
    std::lock_guard<std::mutex> lg(this->fw_mutex);
    auto iter = this->fw_entries.find(id);

    if (iter == this->fw_entries.end()) {
        return;
    }

    log_debug("unsubscribed %llu from %s",
              (unsigned long long) id,
              iter->second.e_name.c_str());
    if (this->uses_inotify() && iter->second.e_active) {
        this->remove_dir_watch(iter->second.e_dir);
    }
    this->fw_entries.erase(iter);
}

bool
file_watcher::add_dir_watch(const std::filesystem::path& dir)
{
#ifdef HAVE_SYS_INOTIFY_H
    auto iter = this->fw_dirs.find(dir);

    if (iter != this->fw_dirs.end()) {
        iter->second.wd_refs += 1;
        return true;
    }

    auto wd = inotify_add_watch(this->fw_inotify_fd,
                                dir.c_str(),
                                IN_CREATE | IN_DELETE | IN_MOVED_FROM
                                    | IN_MOVED_TO | IN_ONLYDIR);
    if (wd == -1) {
        log_warning("unable to watch directory: %s -- %s",
                    dir.c_str(),
                    strerror(errno));
        return false;
    }

    log_debug("watching directory %s (wd=%d)", dir.c_str(), wd);
    this->fw_dirs[dir] = watched_dir{wd, 1};
    this->fw_descriptor_to_dir[wd] = dir;

    return true;
#else
    return false;
#endif
}

void
file_watcher::remove_dir_watch(const std::filesystem::path& dir)
{
#ifdef HAVE_SYS_INOTIFY_H
    auto iter = this->fw_dirs.find(dir);

    if (iter == this->fw_dirs.end()) {
        return;
    }

    iter->second.wd_refs -= 1;
    if (iter->second.wd_refs > 0) {
        return;
    }

    auto wd = iter->second.wd_descriptor;

    log_debug("no longer watching directory %s (wd=%d)", dir.c_str(), wd);
    this->fw_descriptor_to_dir.erase(wd);
    this->fw_dirs.erase(iter);
    // EINVAL means the kernel already dropped the watch with the directory
    if (inotify_rm_watch(this->fw_inotify_fd, wd) == -1 && errno != EINVAL) {
        log_warning("inotify_rm_watch(%s) failed -- %s",
                    dir.c_str(),
                    strerror(errno));
    }
#endif
}

std::chrono::milliseconds
file_watcher::compute_timeout(mstime_t current_time) const
{
    if (this->uses_inotify()) {
        // loop_body() blocks in poll(2) instead
        return std::chrono::milliseconds(0);
    }

    return this->fw_config.c_stat_interval;
}

void
file_watcher::loop_body()
{
    if (this->uses_inotify()) {
        this->read_inotify_events();
    } else {
        this->scan_entries();
    }
}

void
file_watcher::dispatch(const std::filesystem::path& dir,
                       const std::string& name,
                       watch_event evt)
{
    for (auto& pair : this->fw_entries) {
        auto& ent = pair.second;

        if (ent.e_dir != dir || ent.e_name != name) {
            continue;
        }

        log_debug("%s: %s", (dir / name).c_str(), tailstream::to_string(evt));
        ent.e_callback(evt);
    }
}

void
file_watcher::dispatch_all(watch_event evt)
{
    for (auto& pair : this->fw_entries) {
        pair.second.e_callback(evt);
    }
}

void
file_watcher::read_inotify_events()
{
#ifdef HAVE_SYS_INOTIFY_H
    struct pollfd pfd;

    pfd.fd = this->fw_inotify_fd;
    pfd.events = POLLIN;
    pfd.revents = 0;

    auto rc = poll(&pfd, 1, this->fw_config.c_poll_timeout.count());
    if (rc == -1) {
        if (errno != EINTR) {
            log_error("poll() on inotify descriptor failed -- %s",
                      strerror(errno));
        }
        return;
    }
    if (rc == 0) {
        return;
    }

    alignas(struct inotify_event) char buffer[16 * (sizeof(struct inotify_event) + NAME_MAX + 1)];

    while (true) {
        auto len = read(this->fw_inotify_fd, buffer, sizeof(buffer));

        if (len <= 0) {
            if (len == -1 && errno != EAGAIN && errno != EINTR) {
                log_error("read() of inotify events failed -- %s",
                          strerror(errno));
            }
            break;
        }

        std::lock_guard<std::mutex> lg(this->fw_mutex);

        for (ssize_t off = 0; off < len;) {
            const auto* evt
                = reinterpret_cast<const struct inotify_event*>(&buffer[off]);

            off += sizeof(struct inotify_event) + evt->len;
            if (evt->mask & IN_Q_OVERFLOW) {
                log_warning("inotify queue overflowed, notifying everyone");
                this->dispatch_all(watch_event::created);
                continue;
            }

            auto dir_iter = this->fw_descriptor_to_dir.find(evt->wd);
            if (dir_iter == this->fw_descriptor_to_dir.end()) {
                continue;
            }
            if (evt->mask & IN_IGNORED) {
                log_info("watch on directory was removed: %s",
                         dir_iter->second.c_str());
                for (auto& pair : this->fw_entries) {
                    if (pair.second.e_dir == dir_iter->second) {
                        pair.second.e_active = false;
                    }
                }
                this->fw_dirs.erase(dir_iter->second);
                this->fw_descriptor_to_dir.erase(dir_iter);
                continue;
            }
            if (evt->len == 0) {
                continue;
            }

            std::string name(evt->name);
            if (evt->mask & (IN_CREATE | IN_MOVED_TO)) {
                this->dispatch(dir_iter->second, name, watch_event::created);
            }
            if (evt->mask & (IN_DELETE | IN_MOVED_FROM)) {
                this->dispatch(dir_iter->second, name, watch_event::deleted);
            }
        }
    }
#endif
}

void
file_watcher::scan_entries()
{
    std::lock_guard<std::mutex> lg(this->fw_mutex);

    for (auto& pair : this->fw_entries) {
        auto& ent = pair.second;
        auto stat_res = filesystem::stat_file(ent.e_dir / ent.e_name);

        if (stat_res.isErr()) {
            if (ent.e_last_stat) {
                ent.e_last_stat = std::nullopt;
                ent.e_callback(watch_event::deleted);
            }
            continue;
        }

        auto st = stat_res.unwrap();
        if (!ent.e_last_stat) {
            ent.e_last_stat = st;
            ent.e_callback(watch_event::created);
        } else if (!filesystem::is_same_file(ent.e_last_stat.value(), st)) {
            ent.e_last_stat = st;
            ent.e_callback(watch_event::deleted);
            ent.e_callback(watch_event::created);
        }
    }
}

}  // namespace tailstream
