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
#include <exception>

#include "defs.hxx"

namespace mprpc {
/**
 * Describes a client
 */
struct client_profile {
    size_t local_id = 0;

    string name;
    string peer_name;
};

/**
 * All events can be invoked from the reader, writer or any worker thread!
 *
 * Callbacks must not throw; they run inside noexcept loops, where an exception terminates.
 */
class if_client_monitor
{
   public:
    virtual ~if_client_monitor() = default;

    virtual void on_client_started(client_profile const&) {}
    virtual void on_client_stopped(client_profile const&) {}

    /**
     * Received frame was dropped, and the reader continues.
     */
    virtual void on_receive_warning(client_profile const&, frame_state) {}

    /**
     * Inbound request/notify handler threw.
     */
    virtual void on_handler_error(client_profile const&, std::exception&) {}

    /**
     * Reader stopped on transport or decode failure. No further inbound frame is handled.
     */
    virtual void on_reader_expired(client_profile const&, std::exception&) {}

    /**
     * Writer stopped on transport or encode failure. No further outbound frame is sent.
     */
    virtual void on_writer_expired(client_profile const&, std::exception&) {}
};
}  // namespace mprpc
