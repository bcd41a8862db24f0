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
#include <cassert>
#include <type_traits>

#include "client.hxx"

namespace mprpc {
/**
 * Builds a client.
 *
 * @tparam SlotValue A compile-time flag for verifying correct creation of client
 */
template <int SlotValue>
class basic_client_builder
{
    template <int>
    friend class basic_client_builder;

    enum slot_flags {
        slot_transport,

        opt_slot_codec,
        opt_slot_monitor,
        opt_slot_logger,
        opt_slot_options,
    };

   private:
    client_ptr _client;

   private:
    template <slot_flags... Values,
              typename = std::enable_if_t<not(SlotValue & ((1 << Values) | ...))>>
    auto& _make_ref() noexcept
    {
        return (basic_client_builder<((SlotValue | (1 << Values)) | ...)>&)*this;
    }

   public:
    basic_client_builder()
            : _client(std::make_unique<client>(client::_ctor_hide_type{}))
    {
        static_assert(SlotValue == 0, "Start from client::builder");
    }

   public:
    inline auto& transport(transport_ptr ptr)
    {
        assert(ptr);
        _client->_transport = std::move(ptr);
        return _make_ref<slot_transport>();
    }

    inline auto& codec(unique_ptr<if_frame_codec> ptr)
    {
        assert(ptr);
        _client->_codec = std::move(ptr);
        return _make_ref<opt_slot_codec>();
    }

    inline auto& monitor(shared_ptr<if_client_monitor> ptr)
    {
        assert(ptr);
        _client->_monitor = std::move(ptr);
        return _make_ref<opt_slot_monitor>();
    }

    inline auto& logger(shared_ptr<spdlog::logger> ptr)
    {
        assert(ptr);
        _client->_logger = std::move(ptr);
        return _make_ref<opt_slot_logger>();
    }

    inline auto& options(client_options opts)
    {
        _client->_opts = std::move(opts);
        return _make_ref<opt_slot_options>();
    }

    [[nodiscard]] inline client_ptr build()
    {
        static_assert(SlotValue & (1 << slot_transport), "Transport is required");

        _client->_initialize();
        return std::move(_client);
    }

    inline void build_to(client_ptr& out)
    {
        out.reset();
        out = build();
    }
};
}  // namespace mprpc
