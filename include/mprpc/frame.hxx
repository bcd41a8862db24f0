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
#include "defs.hxx"

namespace mprpc {
/**
 * Frame kinds, the first element of every frame
 *
 *   request  : [0, msgid, method, params]
 *   response : [1, msgid, error, result]
 *   notify   : [2, method, params]
 */
enum class msgtype {
    request = 0,
    response = 1,
    notify = 2,
};

/**
 * Frame builders. Arguments of type value are consumed.
 */
value make_request(msgid_t msgid, string_view method, value params);
value make_response(msgid_t msgid, value error, value result);
value make_response(msgid_t msgid, rpc_result&& outcome);
value make_notify(string_view method, value params);

/**
 * Verify frame shape completely. On okay, *type receives the frame kind.
 *
 * Only frames that pass inspection may be used with the accessors below.
 */
frame_state inspect(value const& frame, msgtype* type) noexcept;

inline msgtype frame_type(value const& frame) { return msgtype(frame[0].get<int>()); }
inline msgid_t frame_id(value const& frame) { return frame[1].get<msgid_t>(); }

/**
 * Method name of an inspected request or notify frame
 */
string const& frame_method(value const& frame);

/**
 * Params slot of an inspected request or notify frame
 */
value& frame_params(value& frame);

/**
 * Split an inspected response frame into its outcome. The frame is consumed.
 */
rpc_result take_outcome(value&& frame);
}  // namespace mprpc
