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
#include <atomic>
#include <mutex>

#include "codec.hxx"
#include "defs.hxx"
#include "detail/id_allocator.hxx"
#include "detail/method_registry.hxx"
#include "detail/outbound_queue.hxx"
#include "detail/pending_calls.hxx"
#include "detail/response_buffer.hxx"
#include "monitor.hxx"
#include "options.hxx"
#include "thread/worker_pool.hxx"
#include "transport.hxx"

namespace spdlog {
class logger;
}

namespace mprpc {
template <int>
class basic_client_builder;

/**
 * Bidirectional msgpack-RPC endpoint over a single transport.
 *
 * Outbound calls block the calling thread until the correlated response arrives. Inbound
 *  requests and notifications are handled by registered handlers on the worker pool, which
 *  also runs the reader and writer loop.
 *
 * Lifecycle: build -> register methods -> start() -> call()/notify() -> stop() -> destroy.
 *  Destruction waits for every running task, then releases every frame still queued.
 */
class client
{
    template <int>
    friend class basic_client_builder;

   public:
    using builder = basic_client_builder<0>;

   private:
    enum class state {
        created,
        running,
        stopped,
    };

   private:
    shared_ptr<spdlog::logger> _logger;
    shared_ptr<if_client_monitor> _monitor;

    transport_ptr _transport;
    unique_ptr<if_frame_codec> _codec;

    client_options _opts;
    client_profile _profile;

    detail::method_registry _methods;
    detail::id_allocator _ids;
    detail::pending_calls _pending;
    detail::response_buffer _responses;
    detail::outbound_queue _outbound;

    std::atomic<state> _state = state::created;

    // Loops run while this is set
    std::atomic_bool _alive = false;

    std::atomic_bool _reader_alive = false;
    std::atomic_bool _writer_alive = false;

    // Transport can be closed only once
    std::once_flag _flag_transport_close;

    // Declared last; must be shut down before anything above is released.
    unique_ptr<worker_pool> _pool;

   private:
    // Hides constructor from public
    enum class _ctor_hide_type {};

   public:
    client() = delete;
    explicit client(_ctor_hide_type) noexcept {}
    ~client();

    client(client const&) = delete;
    client& operator=(client const&) = delete;

   public:
    /**
     * Bind request handler to method name. Replaces existing binding of either kind.
     */
    void register_call_method(string name, call_handler handler);

    /**
     * Bind notification handler to method name. Replaces existing binding of either kind.
     */
    void register_notify_method(string name, notify_handler handler);

    /**
     * Launch reader and writer loop.
     *
     * @throw std::logic_error if already started or stopped.
     */
    void start();

    /**
     * Send request and block until its response arrives. There is no timeout: if the peer
     *  never answers, this never returns.
     *
     * Can be issued before start(); the request is sent once the writer runs.
     *
     * @param params Consumed.
     * @return Remote error or result, whichever the peer set.
     * @throw rpc_exception client_stopped, transport_expired, duplicate_id, response_not_found
     */
    rpc_result call(string_view method, value params);

    /**
     * Send notification without waiting.
     *
     * @param params Consumed.
     * @return false if the client is stopped or its writer expired; nothing is sent then.
     */
    bool notify(string_view method, value params);

    /**
     * Stop reader and writer loop. Does not unblock callers waiting in call().
     */
    void stop();

   public:
    bool running() const noexcept { return _state.load() == state::running; }
    bool reader_alive() const noexcept { return _reader_alive.load(std::memory_order_acquire); }
    bool writer_alive() const noexcept { return _writer_alive.load(std::memory_order_acquire); }

    size_t num_pending_calls() const { return _pending.size(); }
    size_t num_buffered_responses() const { return _responses.size(); }
    size_t num_queued_frames() const { return _outbound.size(); }

    client_profile const& profile() const noexcept { return _profile; }
    client_options const& options() const noexcept { return _opts; }

    /**
     * Get total number of transferred bytes
     */
    void totals(size_t* nread, size_t* nwrite) const;

   private:
    void _initialize();
    errc _check_sendable() const noexcept;
    void _close_transport() noexcept;

    void _reader_loop() noexcept;
    void _writer_loop() noexcept;

    void _handle_frame(value&& frame);
    void _handle_request(call_handler const& handler, value frame) noexcept;
    void _handle_notify(notify_handler const& handler, value frame) noexcept;
};

using client_ptr = unique_ptr<client>;
}  // namespace mprpc
