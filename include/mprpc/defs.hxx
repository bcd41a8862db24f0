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
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

#include "value.hxx"

namespace mprpc {
using std::make_shared;
using std::make_unique;
using std::shared_ptr;
using std::string;
using std::string_view;
using std::unique_ptr;

using msgid_t = uint32_t;

/**
 * Errors surfaced to the immediate caller
 */
enum class errc {
    okay = 0,

    duplicate_id,
    response_not_found,
    client_stopped,
    transport_expired,
};

class rpc_error_category : public std::error_category
{
   public:
    const char* name() const noexcept override
    {
        return "mprpc";
    }

    std::string message(int ec) const override
    {
        switch (errc{ec}) {
            case errc::okay: return "No error";
            case errc::duplicate_id: return "Request id is already pending";
            case errc::response_not_found: return "Woken caller found no matching response";
            case errc::client_stopped: return "Client is stopped";
            case errc::transport_expired: return "Transport is expired";

            default: return "Unknown error";
        }
    }

    static rpc_error_category const* instance() noexcept
    {
        static rpc_error_category _cat;
        return &_cat;
    }
};

inline std::error_code make_error_code(errc ec) noexcept
{
    return {int(ec), *rpc_error_category::instance()};
}

class rpc_exception : public std::system_error
{
   public:
    explicit rpc_exception(errc ec) : std::system_error(make_error_code(ec)) {}
    rpc_exception(errc ec, std::string const& what) : std::system_error(make_error_code(ec), what) {}
    rpc_exception(errc ec, char const* what) : std::system_error(make_error_code(ec), what) {}
};

/**
 * Classification of a single received frame.
 */
enum class frame_state {
    okay = 0,

    // Frame is dropped, and the reader continues.
    _warnings_ = 1,
    warning_invalid_format,
    warning_invalid_message_type,
    warning_unknown_method_name,
    warning_handler_kind_mismatch,
};

char const* to_string(frame_state state) noexcept;

/**
 * Outcome of a call: exactly one of error or result.
 */
class rpc_result
{
    value _value;
    bool _is_error = false;

   public:
    rpc_result() = default;

    static rpc_result ok(value result) noexcept
    {
        rpc_result r;
        r._value = std::move(result);
        return r;
    }

    static rpc_result error(value error) noexcept
    {
        rpc_result r;
        r._value = std::move(error);
        r._is_error = true;
        return r;
    }

   public:
    bool is_error() const noexcept { return _is_error; }
    explicit operator bool() const noexcept { return not _is_error; }

    value& get() & noexcept { return _value; }
    value const& get() const& noexcept { return _value; }
    value&& get() && noexcept { return std::move(_value); }
};

// A throwing handler is answered with an error response carrying the exception message, or
//  "unknown exception" for types not derived from std::exception.
using call_handler = std::function<rpc_result(value params)>;
using notify_handler = std::function<void(value params)>;
}  // namespace mprpc

namespace std {
template <>
struct is_error_code_enum<mprpc::errc> : true_type {
};
}  // namespace std
