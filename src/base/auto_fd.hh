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
 * @file auto_fd.hh
 */

#ifndef tailstream_auto_fd_hh
#define tailstream_auto_fd_hh

#include <utility>

/**
 * Resource management class for file descriptors.  The descriptor is closed
 * when the object is destroyed or when a new descriptor is stored.
 */
class auto_fd {
public:
    /**
     * Construct an auto_fd to manage the given file descriptor.
     *
     * @param fd The file descriptor to be managed.
     */
    explicit auto_fd(int fd = -1);

    /**
     * Management of the file descriptor will be transferred from the source
     * to this object and the source will be cleared.
     */
    auto_fd(auto_fd&& af) noexcept;

    auto_fd(const auto_fd& af) = delete;

    ~auto_fd();

    /** @return The file descriptor as a plain integer. */
    operator int() const { return this->af_fd; }

    auto_fd& operator=(auto_fd&& af) noexcept
    {
        this->reset(af.release());
        return *this;
    }

    auto_fd& operator=(const auto_fd&) = delete;

    /**
     * Stop managing the file descriptor in this object and return its value.
     */
    int release() { return std::exchange(this->af_fd, -1); }

    int get() const { return this->af_fd; }

    bool has_value() const { return this->af_fd != -1; }

    /**
     * Closes the current file descriptor and replaces its value with the given
     * one.
     */
    void reset(int fd = -1);

private:
    int af_fd; /*< The managed file descriptor. */
};

#endif
