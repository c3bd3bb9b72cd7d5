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
 * @file line_reader.cc
 */

#include <algorithm>

#include "line_reader.hh"

#include "base/sequence_search.hh"
#include "base/tailstream_log.hh"
#include "config.h"
#include "fmt/format.h"

namespace tailstream {

static const char UTF8_BOM[] = "\xef\xbb\xbf";
static const size_t UTF8_BOM_SIZE = 3;

line_reader::line_reader(byte_stream& src, line_reader_config cfg)
    : lr_source(src), lr_config(std::move(cfg)),
      lr_encoding(this->lr_config.c_encoding)
{
    if (!this->lr_source.can_read()) {
        throw std::invalid_argument(fmt::format(
            FMT_STRING("stream is not readable: {}"), src.to_string()));
    }
    if (this->lr_config.c_block_size == 0) {
        throw std::invalid_argument("block size must be greater than zero");
    }
    if (this->lr_encoding.get_line_terminator().empty()) {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("encoding has no line terminator: {}"),
                        this->lr_config.c_encoding));
    }
    if (this->lr_config.c_max_line_length
        && this->lr_config.c_max_line_length.value() == 0)
    {
        throw std::invalid_argument(
            "max line length must be greater than zero");
    }
}

line_reader::line_sequence
line_reader::read_lines()
{
    return line_sequence(*this, this->lr_config.c_max_line_length);
}

line_reader::line_sequence
line_reader::read_lines(size_t max_line_length)
{
    if (max_line_length == 0) {
        throw std::invalid_argument(
            "max line length must be greater than zero");
    }

    return line_sequence(*this, max_line_length);
}

std::string
line_reader::decode_line(const unsigned char* data, size_t len)
{
    auto retval = this->lr_encoding.decode(data, len);
    size_t start = 0;

    while (retval.compare(start, UTF8_BOM_SIZE, UTF8_BOM) == 0) {
        start += UTF8_BOM_SIZE;
    }

    auto end = retval.size();
    while (end > start && (retval[end - 1] == '\n' || retval[end - 1] == '\r'))
    {
        end -= 1;
    }

    return retval.substr(start, end - start);
}

void
line_reader::line_sequence::add_line(const unsigned char* data, size_t len)
{
    auto line = this->ls_reader.decode_line(data, len);

    if (!this->ls_max_line_length) {
        this->ls_pending.emplace_back(pending_line{std::move(line), len});
        return;
    }

    auto max_len = this->ls_max_line_length.value();
    auto consumed = len;
    auto cp_count = text_encoding::utf8_length(line);
    size_t start = 0;

    // The whole line is accounted for when its first chunk is returned.
    while (cp_count > max_len) {
        auto chunk_end = start
            + text_encoding::utf8_byte_index(line.substr(start), max_len);

        this->ls_pending.emplace_back(
            pending_line{line.substr(start, chunk_end - start), consumed});
        consumed = 0;
        start = chunk_end;
        cp_count -= max_len;
    }
    this->ls_pending.emplace_back(pending_line{line.substr(start), consumed});
}

bool
line_reader::line_sequence::fill()
{
    auto& src = this->ls_reader.lr_source;
    const auto& terminator = this->ls_reader.get_line_terminator();

    if (!this->ls_started) {
        this->ls_started = true;
        this->ls_reader.lr_position = src.position();
    }

    while (this->ls_pending.empty() && !this->ls_done) {
        auto len = src.length();
        auto pos = src.position();
        size_t got = 0;
        std::vector<unsigned char> working;

        if (pos < len) {
            auto avail = static_cast<size_t>(len - pos);
            auto block_size
                = std::min(avail, this->ls_reader.lr_config.c_block_size);

            working.swap(this->ls_remainder);
            working.resize(working.size() + block_size);
            got = src.read(
                working, working.size() - block_size, block_size);
            working.resize(working.size() - block_size + got);
        }

        if (got == 0) {
            if (!working.empty()) {
                this->ls_remainder.swap(working);
            }
            if (!this->ls_remainder.empty()) {
                log_trace("emitting unterminated line of %zu bytes",
                          this->ls_remainder.size());
                this->add_line(this->ls_remainder.data(),
                               this->ls_remainder.size());
                this->ls_remainder.clear();
            }
            this->ls_done = true;
            break;
        }

        // The carried over bytes hold no terminator that starts on a code
        // unit boundary, but one may straddle the end of the carried over
        // bytes and the start of the new block.
        auto unit = terminator.size();
        auto carried = working.size() - got;
        size_t processed = 0;
        size_t search_from = carried - (carried % unit);

        while (true) {
            auto match = sequence::find_first(working, terminator, search_from);

            if (match == -1) {
                break;
            }
            if ((match - processed) % unit != 0) {
                search_from = match + 1;
                continue;
            }

            auto line_end = match + unit;
            this->add_line(&working[processed], line_end - processed);
            processed = line_end;
            search_from = line_end;
        }

        this->ls_remainder.assign(working.begin() + processed, working.end());
    }

    return !this->ls_pending.empty();
}

std::optional<std::string>
line_reader::line_sequence::next()
{
    if (!this->fill()) {
        return std::nullopt;
    }

    auto& front = this->ls_pending.front();
    auto retval = std::move(front.pl_text);

    this->ls_reader.lr_position += front.pl_consumed;
    this->ls_pending.pop_front();

    return retval;
}

}  // namespace tailstream
