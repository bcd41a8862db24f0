/*******************************************************************************
 * MIT License
 *
 * Copyright (c) 2022. Seungwoo Kang
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 *
 * project home: https://github.com/perfkitpp
 ******************************************************************************/

#pragma once
#include <stdexcept>
#include <streambuf>
#include <vector>

#include "value.hxx"

namespace mprpc {
/**
 * Raised when a value cannot be decoded from, or encoded into, a stream.
 */
class codec_error : public std::runtime_error
{
   public:
    using std::runtime_error::runtime_error;
};

/**
 * Encodes/decodes exactly one value per call.
 */
class if_frame_codec
{
   public:
    virtual ~if_frame_codec() = default;

    /**
     * Decode single value, consuming exactly its bytes. Blocks until the value is complete.
     *
     * @throw codec_error on malformed or truncated input.
     */
    virtual value read(std::streambuf& in) = 0;

    /**
     * Encode single value into stream. Does not flush.
     *
     * @throw codec_error if stream rejects bytes.
     */
    virtual void write(std::streambuf& out, value const& frame) = 0;
};

namespace codec {
class msgpack : public if_frame_codec
{
    std::vector<uint8_t> _wbuf;

   public:
    value read(std::streambuf& in) override;
    void write(std::streambuf& out, value const& frame) override;
};
}  // namespace codec
}  // namespace mprpc
