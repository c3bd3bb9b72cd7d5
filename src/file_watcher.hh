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
 * @file file_watcher.hh
 */

#ifndef tailstream_file_watcher_hh
#define tailstream_file_watcher_hh

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include <sys/stat.h>

#include "base/auto_fd.hh"
#include "base/isc.hh"
#include "tailstream.cfg.hh"

namespace tailstream {

enum class watch_event {
    created,
    deleted,
};

const char* to_string(watch_event evt);

/**
 * Delivers "created" and "deleted" notifications for individual paths.  A
 * single background thread watches the parent directories of all subscribed
 * paths, using inotify(7) where available and periodic stat(2) calls
 * otherwise.
 *
 * Callbacks run on the watcher thread while the subscription table is
 * locked.  Once a subscription has been released, its callback is not running
 * and will not be called again.  Callbacks must not create or release
 * subscriptions.
 */
class file_watcher final
    : public isc::service_base
    , public std::enable_shared_from_this<file_watcher> {
public:
    using callback_t = std::function<void(watch_event)>;

    class subscription {
    public:
        subscription() = default;

        subscription(subscription&& other) noexcept
            : s_watcher(std::move(other.s_watcher)),
              s_id(std::exchange(other.s_id, 0))
        {
        }

        subscription& operator=(subscription&& other) noexcept
        {
            if (this != &other) {
                this->reset();
                this->s_watcher = std::move(other.s_watcher);
                this->s_id = std::exchange(other.s_id, 0);
            }
            return *this;
        }

        subscription(const subscription&) = delete;
        subscription& operator=(const subscription&) = delete;

        ~subscription() { this->reset(); }

        /** @return True if notifications can be delivered for the path. */
        bool is_active() const;

        bool has_value() const { return this->s_watcher != nullptr; }

        /** Release the subscription. */
        void reset();

    private:
        friend class file_watcher;

        subscription(std::shared_ptr<file_watcher> fw, uint64_t id)
            : s_watcher(std::move(fw)), s_id(id)
        {
        }

        std::shared_ptr<file_watcher> s_watcher;
        uint64_t s_id{0};
    };

    /**
     * @return The process-wide watcher, created on first use and destroyed
     * when the last subscription to it is released.
     */
    static std::shared_ptr<file_watcher> shared();

    /** Set the configuration used when shared() creates a watcher. */
    static void set_default_config(const watcher_config& cfg);

    static std::shared_ptr<file_watcher> create(watcher_config cfg = {});

    ~file_watcher() override;

    subscription subscribe(const std::filesystem::path& path, callback_t cb);

    size_t subscription_count() const;

    bool uses_inotify() const { return this->fw_inotify_fd.has_value(); }

protected:
    void loop_body() override;

    std::chrono::milliseconds compute_timeout(
        mstime_t current_time) const override;

private:
    struct entry {
        std::filesystem::path e_dir;
        std::string e_name;
        callback_t e_callback;
        bool e_active{false};
        std::optional<struct stat> e_last_stat;
    };

    struct watched_dir {
        int wd_descriptor{-1};
        size_t wd_refs{0};
    };

    explicit file_watcher(watcher_config cfg);

    bool is_subscription_active(uint64_t id) const;
    void unsubscribe(uint64_t id);
    bool add_dir_watch(const std::filesystem::path& dir);
    void remove_dir_watch(const std::filesystem::path& dir);
    void dispatch(const std::filesystem::path& dir,
                  const std::string& name,
                  watch_event evt);
    void dispatch_all(watch_event evt);
    void read_inotify_events();
    void scan_entries();

    watcher_config fw_config;
    mutable std::mutex fw_mutex;
    std::map<uint64_t, entry> fw_entries;
    uint64_t fw_next_id{1};
    auto_fd fw_inotify_fd;
    std::map<std::filesystem::path, watched_dir> fw_dirs;
    std::map<int, std::filesystem::path> fw_descriptor_to_dir;
};

}  // namespace tailstream

#endif
