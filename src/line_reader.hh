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
 * @file line_reader.hh
 */

#ifndef tailstream_line_reader_hh
#define tailstream_line_reader_hh

#include <cstddef>
#include <deque>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

#include "base/text_encoding.hh"
#include "byte_stream.hh"
#include "tailstream.cfg.hh"

namespace tailstream {

/**
 * Splits the contents of a stream into lines of text.  The stream is read in
 * blocks, starting from its current position, and bytes that do not end in a
 * line terminator are carried over to the next block.  Lines are decoded from
 * the configured encoding into UTF-8 with trailing carriage-returns and
 * line-feeds removed.
 */
class line_reader {
public:
    /**
     * A single pass over the lines of the stream.  Nothing is read until the
     * first line is requested.  The sequence ends once the stream has no more
     * data, at which point any trailing unterminated text is returned as the
     * last line.
     */
    class line_sequence {
    public:
        class iterator {
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = std::string;
            using difference_type = std::ptrdiff_t;
            using pointer = const std::string*;
            using reference = const std::string&;

            iterator() = default;

            reference operator*() const { return this->i_current.value(); }
            pointer operator->() const { return &this->i_current.value(); }

            iterator& operator++()
            {
                this->i_current = this->i_sequence->next();
                if (!this->i_current) {
                    this->i_sequence = nullptr;
                }
                return *this;
            }

            bool operator==(const iterator& other) const
            {
                return this->i_sequence == other.i_sequence;
            }

            bool operator!=(const iterator& other) const
            {
                return !(*this == other);
            }

        private:
            friend class line_sequence;

            explicit iterator(line_sequence* seq) : i_sequence(seq)
            {
                ++(*this);
            }

            line_sequence* i_sequence{nullptr};
            std::optional<std::string> i_current;
        };

        /** @return The next line or nullopt when the stream is exhausted. */
        std::optional<std::string> next();

        iterator begin() { return iterator(this); }
        iterator end() { return iterator(); }

    private:
        friend class line_reader;

        struct pending_line {
            std::string pl_text;
            /* Number of source bytes consumed once this line is returned. */
            size_t pl_consumed;
        };

        line_sequence(line_reader& lr, std::optional<size_t> max_line_length)
            : ls_reader(lr), ls_max_line_length(max_line_length)
        {
        }

        bool fill();
        void add_line(const unsigned char* data, size_t len);

        line_reader& ls_reader;
        std::optional<size_t> ls_max_line_length;
        std::vector<unsigned char> ls_remainder;
        std::deque<pending_line> ls_pending;
        bool ls_started{false};
        bool ls_done{false};
    };

    /**
     * @throws std::invalid_argument If the stream is not readable, the block
     *   size is zero, the max line length is zero, or the encoding is not
     *   supported.
     */
    explicit line_reader(byte_stream& src, line_reader_config cfg = {});

    line_sequence read_lines();

    /** Read lines, splitting any longer than the given number of code points. */
    line_sequence read_lines(size_t max_line_length);

    /**
     * @return The offset in the source just past the last line that was
     * returned.
     */
    file_off_t get_position() const { return this->lr_position; }

    file_ssize_t get_length() { return this->lr_source.length(); }

    byte_stream& get_base_stream() { return this->lr_source; }

    size_t get_block_size() const { return this->lr_config.c_block_size; }

    const std::string& get_encoding() const
    {
        return this->lr_encoding.get_name();
    }

    const std::vector<unsigned char>& get_line_terminator() const
    {
        return this->lr_encoding.get_line_terminator();
    }

private:
    std::string decode_line(const unsigned char* data, size_t len);

    byte_stream& lr_source;
    const line_reader_config lr_config;
    text_encoding lr_encoding;
    file_off_t lr_position{0};
};

}  // namespace tailstream

#endif
