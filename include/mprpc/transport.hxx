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
#include <memory>
#include <streambuf>
#include <string>

namespace mprpc {
/**
 * Duplex byte stream, split into independently buffered read and write halves.
 *
 * The read half is only touched by the client's reader loop, and the write half only by its
 *  writer loop; implementations must not share mutable state between the two halves without
 *  synchronizing it.
 */
class if_transport
{
   private:
    std::streambuf* const _rd;
    std::streambuf* const _wr;

   public:
    std::string const peer_name;

   public:
    virtual ~if_transport() noexcept = default;

    if_transport(std::streambuf* rd, std::streambuf* wr, std::string peer_name) noexcept
            : _rd(rd),
              _wr(wr),
              peer_name(std::move(peer_name)) {}

   public:
    /**
     * Buffered read half
     */
    std::streambuf* reader() const noexcept { return _rd; }

    /**
     * Buffered write half. Caller flushes with pubsync() after each frame.
     */
    std::streambuf* writer() const noexcept { return _wr; }

    /**
     * Non-blocking probe of read half.
     *
     * Returns true if any byte can be read without blocking, or if the peer hung up, so that
     *  the next read observes end of stream instead of waiting.
     */
    virtual bool readable() noexcept = 0;

    /**
     * Close both halves. Blocked reads return end of stream. Must be safe to call repeatedly.
     */
    virtual void close() noexcept = 0;

    /**
     * Get total number of read/write bytes
     */
    virtual void get_total_rw(size_t* num_read, size_t* num_write) = 0;
};

using transport_ptr = std::unique_ptr<if_transport>;
}  // namespace mprpc
