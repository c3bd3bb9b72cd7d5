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
 * @file text_encoding.cc
 */

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "text_encoding.hh"

#include <errno.h>
#include <string.h>

#include "config.h"
#include "fmt/format.h"
#include "tailstream_log.hh"

namespace tailstream {

static constexpr const char REPLACEMENT_CHAR[] = "\xef\xbf\xbd";

const char* text_encoding::DEFAULT_NAME = "UTF-8";

text_encoding::text_encoding(std::string name) : te_name(std::move(name))
{
    this->te_decoder = iconv_open("UTF-8", this->te_name.c_str());
    if (this->te_decoder == (iconv_t) -1) {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("unsupported text encoding: {} -- {}"),
                        this->te_name,
                        strerror(errno)));
    }
    this->te_encoder = iconv_open(this->te_name.c_str(), "UTF-8");
    if (this->te_encoder == (iconv_t) -1) {
        auto err = errno;

        iconv_close(this->te_decoder);
        throw std::invalid_argument(
            fmt::format(FMT_STRING("unsupported text encoding: {} -- {}"),
                        this->te_name,
                        strerror(err)));
    }

    this->te_line_terminator = this->encode("\n");
    if (this->te_line_terminator.empty()) {
        iconv_close(this->te_decoder);
        iconv_close(this->te_encoder);
        throw std::invalid_argument(fmt::format(
            FMT_STRING("text encoding cannot represent a line feed: {}"),
            this->te_name));
    }
    log_debug("text encoding %s uses a %zu byte line terminator",
              this->te_name.c_str(),
              this->te_line_terminator.size());
}

text_encoding::text_encoding(text_encoding&& other) noexcept
    : te_name(std::move(other.te_name)),
      te_decoder(std::exchange(other.te_decoder, (iconv_t) -1)),
      te_encoder(std::exchange(other.te_encoder, (iconv_t) -1)),
      te_line_terminator(std::move(other.te_line_terminator))
{
}

text_encoding::~text_encoding()
{
    if (this->te_decoder != (iconv_t) -1) {
        iconv_close(this->te_decoder);
    }
    if (this->te_encoder != (iconv_t) -1) {
        iconv_close(this->te_encoder);
    }
}

std::vector<unsigned char>
text_encoding::convert_to(const std::string& utf8)
{
    std::vector<unsigned char> retval(utf8.size() * 4 + 16);
    auto* in_ptr = const_cast<char*>(utf8.data());
    size_t in_left = utf8.size();
    auto* out_ptr = reinterpret_cast<char*>(retval.data());
    size_t out_left = retval.size();

    iconv(this->te_encoder, nullptr, nullptr, nullptr, nullptr);
    while (in_left > 0) {
        auto rc = iconv(this->te_encoder, &in_ptr, &in_left, &out_ptr, &out_left);

        if (rc == (size_t) -1) {
            if (errno == E2BIG) {
                auto used = retval.size() - out_left;

                retval.resize(retval.size() * 2);
                out_ptr = reinterpret_cast<char*>(retval.data()) + used;
                out_left = retval.size() - used;
                continue;
            }
            throw std::invalid_argument(fmt::format(
                FMT_STRING("unable to encode text as {} -- {}"),
                this->te_name,
                strerror(errno)));
        }
    }
    retval.resize(retval.size() - out_left);

    return retval;
}

std::vector<unsigned char>
text_encoding::encode(const std::string& utf8)
{
    if (utf8.empty()) {
        return {};
    }

    // Some encodings (e.g. "UTF-16") emit a byte-order mark at the start of
    // every conversion.  Encoding the text twice exposes the prefix, since the
    // doubled output is the prefix followed by two copies of the payload.
    auto single = this->convert_to(utf8);
    auto doubled = this->convert_to(utf8 + utf8);
    auto payload_size = doubled.size() - single.size();

    require(payload_size <= single.size());

    return std::vector<unsigned char>(single.end() - payload_size,
                                      single.end());
}

std::string
text_encoding::decode(const unsigned char* data, size_t len)
{
    std::string retval;

    if (len == 0) {
        return retval;
    }

    auto unit_size = std::max<size_t>(1, this->te_line_terminator.size());
    std::vector<char> outbuf(len * 3 + 16);
    auto* in_ptr = reinterpret_cast<char*>(const_cast<unsigned char*>(data));
    size_t in_left = len;

    retval.reserve(len);
    iconv(this->te_decoder, nullptr, nullptr, nullptr, nullptr);
    while (in_left > 0) {
        auto* out_ptr = outbuf.data();
        size_t out_left = outbuf.size();
        auto rc
            = iconv(this->te_decoder, &in_ptr, &in_left, &out_ptr, &out_left);
        auto err = errno;

        retval.append(outbuf.data(), outbuf.size() - out_left);
        if (rc != (size_t) -1) {
            continue;
        }

        switch (err) {
            case E2BIG:
                break;
            case EILSEQ: {
                auto skip = std::min(unit_size, in_left);

                retval.append(REPLACEMENT_CHAR);
                in_ptr += skip;
                in_left -= skip;
                iconv(this->te_decoder, nullptr, nullptr, nullptr, nullptr);
                break;
            }
            case EINVAL:
                retval.append(REPLACEMENT_CHAR);
                in_left = 0;
                break;
            default:
                log_error("iconv failed for %s -- %s",
                          this->te_name.c_str(),
                          strerror(err));
                retval.append(REPLACEMENT_CHAR);
                in_left = 0;
                break;
        }
    }

    return retval;
}

size_t
text_encoding::utf8_length(const std::string& str)
{
    size_t retval = 0;

    for (const auto ch : str) {
        if ((static_cast<unsigned char>(ch) & 0xc0) != 0x80) {
            retval += 1;
        }
    }

    return retval;
}

size_t
text_encoding::utf8_byte_index(const std::string& str, size_t cp_index)
{
    size_t seen = 0;

    for (size_t lpc = 0; lpc < str.size(); lpc++) {
        if ((static_cast<unsigned char>(str[lpc]) & 0xc0) != 0x80) {
            if (seen == cp_index) {
                return lpc;
            }
            seen += 1;
        }
    }

    return str.size();
}

}  // namespace tailstream
