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
 * @file text_encoding.hh
 */

#ifndef tailstream_text_encoding_hh
#define tailstream_text_encoding_hh

#include <string>
#include <vector>

#include <iconv.h>
#include <stddef.h>

namespace tailstream {

/**
 * Conversion between a named character encoding and UTF-8, backed by
 * iconv(3).  Decoded text is always valid UTF-8: malformed input is replaced
 * with U+FFFD.
 *
 * Instances carry conversion state and are not safe for concurrent use.
 */
class text_encoding {
public:
    static const char* DEFAULT_NAME;

    /**
     * @param name An encoding name understood by iconv_open(3), for example
     *   "UTF-8", "UTF-16LE", or "ISO-8859-1".
     * @throws std::invalid_argument If the encoding is not supported.
     */
    explicit text_encoding(std::string name = DEFAULT_NAME);

    text_encoding(text_encoding&& other) noexcept;

    text_encoding(const text_encoding&) = delete;
    text_encoding& operator=(const text_encoding&) = delete;
    text_encoding& operator=(text_encoding&&) = delete;

    ~text_encoding();

    const std::string& get_name() const { return this->te_name; }

    /**
     * Encode UTF-8 text into this encoding.  Byte-order marks that the
     * encoding would prepend are not included.
     */
    std::vector<unsigned char> encode(const std::string& utf8);

    /** Decode bytes in this encoding into UTF-8. */
    std::string decode(const unsigned char* data, size_t len);

    /** The encoded form of a line feed. */
    const std::vector<unsigned char>& get_line_terminator() const
    {
        return this->te_line_terminator;
    }

    /** @return The number of code points in a valid UTF-8 string. */
    static size_t utf8_length(const std::string& str);

    /**
     * @return The byte offset of the given code point index in a valid UTF-8
     * string, or the string length if the index is past the end.
     */
    static size_t utf8_byte_index(const std::string& str, size_t cp_index);

private:
    std::vector<unsigned char> convert_to(const std::string& utf8);

    std::string te_name;
    iconv_t te_decoder{(iconv_t) -1};
    iconv_t te_encoder{(iconv_t) -1};
    std::vector<unsigned char> te_line_terminator;
};

}  // namespace tailstream

#endif
