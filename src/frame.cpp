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

#include "mprpc/frame.hxx"

#include <limits>

namespace mprpc {
namespace {
bool is_msgid(value const& v) noexcept
{
    if (v.is_number_unsigned())
        return v.get<uint64_t>() <= std::numeric_limits<msgid_t>::max();
    if (v.is_number_integer())
        return v.get<int64_t>() >= 0 && v.get<int64_t>() <= std::numeric_limits<msgid_t>::max();

    return false;
}
}  // namespace

value make_request(msgid_t msgid, string_view method, value params)
{
    auto frame = value::array();
    auto& arr = frame.get_ref<value::array_t&>();
    arr.reserve(4);

    arr.emplace_back(int(msgtype::request));
    arr.emplace_back(msgid);
    arr.emplace_back(string{method});
    arr.emplace_back(std::move(params));
    return frame;
}

value make_response(msgid_t msgid, value error, value result)
{
    auto frame = value::array();
    auto& arr = frame.get_ref<value::array_t&>();
    arr.reserve(4);

    arr.emplace_back(int(msgtype::response));
    arr.emplace_back(msgid);
    arr.emplace_back(std::move(error));
    arr.emplace_back(std::move(result));
    return frame;
}

value make_response(msgid_t msgid, rpc_result&& outcome)
{
    if (outcome.is_error())
        return make_response(msgid, std::move(outcome).get(), nullptr);
    else
        return make_response(msgid, nullptr, std::move(outcome).get());
}

value make_notify(string_view method, value params)
{
    auto frame = value::array();
    auto& arr = frame.get_ref<value::array_t&>();
    arr.reserve(3);

    arr.emplace_back(int(msgtype::notify));
    arr.emplace_back(string{method});
    arr.emplace_back(std::move(params));
    return frame;
}

frame_state inspect(value const& frame, msgtype* type) noexcept
{
    if (not frame.is_array()) { return frame_state::warning_invalid_format; }

    auto const size = frame.size();
    if (size < 3 || size > 4) { return frame_state::warning_invalid_format; }

    auto& kind = frame[0];
    if (not kind.is_number_integer()) { return frame_state::warning_invalid_message_type; }

    switch (kind.get<int64_t>()) {
        case int(msgtype::request):
            if (size != 4 || not is_msgid(frame[1]) || not frame[2].is_string())
                return frame_state::warning_invalid_format;

            *type = msgtype::request;
            return frame_state::okay;

        case int(msgtype::response):
            if (size != 4 || not is_msgid(frame[1]))
                return frame_state::warning_invalid_format;

            *type = msgtype::response;
            return frame_state::okay;

        case int(msgtype::notify):
            if (size != 3 || not frame[1].is_string())
                return frame_state::warning_invalid_format;

            *type = msgtype::notify;
            return frame_state::okay;

        default:
            return frame_state::warning_invalid_message_type;
    }
}

string const& frame_method(value const& frame)
{
    auto& slot = frame_type(frame) == msgtype::request ? frame[2] : frame[1];
    return slot.get_ref<string const&>();
}

value& frame_params(value& frame)
{
    return frame_type(frame) == msgtype::request ? frame[3] : frame[2];
}

rpc_result take_outcome(value&& frame)
{
    // Consume the frame, so only the surviving slot outlives this call.
    value consumed = std::move(frame);
    auto& error = consumed[2];

    if (not error.is_null())
        return rpc_result::error(std::move(error));
    else
        return rpc_result::ok(std::move(consumed[3]));
}

char const* to_string(frame_state state) noexcept
{
    switch (state) {
        case frame_state::okay: return "okay";
        case frame_state::warning_invalid_format: return "invalid format";
        case frame_state::warning_invalid_message_type: return "invalid message type";
        case frame_state::warning_unknown_method_name: return "unknown method name";
        case frame_state::warning_handler_kind_mismatch: return "handler kind mismatch";

        default: return "unknown";
    }
}
}  // namespace mprpc
