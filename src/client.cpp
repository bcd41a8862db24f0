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

#include "mprpc/client.hxx"

#include <thread>

#include "mprpc/frame.hxx"
#include "mprpc/helper/macros.hxx"

#define MPRPC_LOGGER() (_logger)

namespace mprpc {
client::~client()
{
    // Builder was dropped before build(); nothing was started, and transport may be absent.
    if (not _pool) { return; }

    stop();

    // A reader blocked in the middle of a frame observes end of stream, and exits.
    _close_transport();

    // Waits for both loops and every dispatched handler. Remaining frames in queues and
    //  buffers are released with their containers.
    _pool->shutdown();

    MPRPC_DEBUG("{}: disposed. {} queued frames, {} unclaimed responses dropped",
                _profile.name, _outbound.size(), _responses.size());
}

void client::register_call_method(string name, call_handler handler)
{
    MPRPC_DEBUG("{}: register call method '{}'", _profile.name, name);
    _methods.add(std::move(name), std::move(handler));
}

void client::register_notify_method(string name, notify_handler handler)
{
    MPRPC_DEBUG("{}: register notify method '{}'", _profile.name, name);
    _methods.add(std::move(name), std::move(handler));
}

void client::start()
{
    auto expected = state::created;
    if (not _state.compare_exchange_strong(expected, state::running))
        throw std::logic_error{"client: start() is allowed only once, before stop()"};

    _alive.store(true, std::memory_order_release);
    _reader_alive.store(true, std::memory_order_release);
    _writer_alive.store(true, std::memory_order_release);

    _pool->post([this] { _writer_loop(); });
    _pool->post([this] { _reader_loop(); });

    MPRPC_INFO("{}: started on '{}' with {} dispatch workers",
               _profile.name, _profile.peer_name, _opts.num_dispatch_workers);
    _monitor->on_client_started(_profile);
}

void client::stop()
{
    auto const prev = _state.exchange(state::stopped);
    if (prev == state::stopped) { return; }

    _alive.store(false, std::memory_order_release);

    // Wake the writer up, so that it observes _alive. Reader notices it on next poll cycle.
    _outbound.post_signal();

    if (prev == state::running) {
        MPRPC_INFO("{}: stopped", _profile.name);
        _monitor->on_client_stopped(_profile);
    }
}

rpc_result client::call(string_view method, value params)
{
    if (auto ec = _check_sendable(); ec != errc::okay)
        throw rpc_exception{ec, string{method}};

    auto const msgid = _ids.next();
    auto frame = make_request(msgid, method, std::move(params));
    auto flag = _pending.add(msgid);

    {
        MPRPC_FINALLY(_pending.remove(msgid));

        MPRPC_TRACE("{}: call '{}' (msgid {})", _profile.name, method, msgid);
        _outbound.enqueue(std::move(frame));

        flag->wait();
    }

    auto response = _responses.take_matching(msgid);
    if (not response)
        throw rpc_exception{errc::response_not_found, "msgid " + std::to_string(msgid)};

    return take_outcome(std::move(*response));
}

bool client::notify(string_view method, value params)
{
    if (_check_sendable() != errc::okay) { return false; }

    MPRPC_TRACE("{}: notify '{}'", _profile.name, method);
    _outbound.enqueue(make_notify(method, std::move(params)));
    return true;
}

void client::totals(size_t* nread, size_t* nwrite) const
{
    _transport->get_total_rw(nread, nwrite);
}

void client::_initialize()
{
    // Unique ID generator for local scope
    static std::atomic_size_t _idgen = 0;

    if (not _logger) { _logger = default_logger(); }
    if (not _monitor) { _monitor = make_shared<if_client_monitor>(); }
    if (not _codec) { _codec = make_unique<codec::msgpack>(); }
    if (_opts.num_dispatch_workers == 0) { _opts.num_dispatch_workers = 1; }

    _profile.local_id = ++_idgen;
    _profile.name = _opts.name;
    _profile.peer_name = _transport->peer_name;

    // Reader and writer occupy a thread each for the client's whole lifetime.
    _pool = make_unique<worker_pool>(_opts.num_dispatch_workers + 2);
}

errc client::_check_sendable() const noexcept
{
    switch (_state.load()) {
        case state::stopped: return errc::client_stopped;
        case state::running: return writer_alive() ? errc::okay : errc::transport_expired;
        default: return errc::okay;
    }
}

void client::_close_transport() noexcept
{
    std::call_once(_flag_transport_close, [this] { _transport->close(); });
}

void client::_reader_loop() noexcept
{
    MPRPC_FINALLY(_reader_alive.store(false, std::memory_order_release));
    auto rd = _transport->reader();

    while (_alive.load(std::memory_order_acquire)) {
        if (not _transport->readable()) {
            std::this_thread::sleep_for(_opts.poll_interval);
            continue;
        }

        value frame;

        try {
            frame = _codec->read(*rd);
        } catch (std::exception& e) {
            if (_alive.load(std::memory_order_acquire)) {
                MPRPC_ERROR("{}: reader expired: {}", _profile.name, e.what());
                _monitor->on_reader_expired(_profile, e);
            } else {
                MPRPC_DEBUG("{}: reader interrupted by shutdown: {}", _profile.name, e.what());
            }

            break;
        }

        try {
            _handle_frame(std::move(frame));
        } catch (std::bad_alloc&) {
            MPRPC_ERROR("{}: out of memory while dispatching frame, dropped", _profile.name);
        }
    }

    MPRPC_DEBUG("{}: reader loop exit", _profile.name);
}

void client::_writer_loop() noexcept
{
    MPRPC_FINALLY(_writer_alive.store(false, std::memory_order_release));
    auto wr = _transport->writer();

    for (;;) {
        _outbound.wait_signal();
        if (not _alive.load(std::memory_order_acquire)) { break; }

        // Empty on the wake-up posted by stop()
        auto frame = _outbound.dequeue();
        if (not frame) { continue; }

        try {
            _codec->write(*wr, *frame);

            if (wr->pubsync() != 0)
                throw codec_error{"transport rejected flush"};
        } catch (std::exception& e) {
            MPRPC_ERROR("{}: writer expired: {}", _profile.name, e.what());
            _monitor->on_writer_expired(_profile, e);
            break;
        }
    }

    MPRPC_DEBUG("{}: writer loop exit", _profile.name);
}

void client::_handle_frame(value&& frame)
{
    msgtype type = {};

    if (auto fs = inspect(frame, &type); fs != frame_state::okay) {
        MPRPC_WARN("{}: dropped {} frame of {} elements: {}",
                   _profile.name, frame.type_name(), frame.size(), to_string(fs));
        _monitor->on_receive_warning(_profile, fs);
        return;
    }

    if (type == msgtype::response) {
        auto const msgid = frame_id(frame);
        _responses.push(std::move(frame));

        // Without a waiter, the response just stays buffered.
        if (not _pending.signal(msgid))
            MPRPC_DEBUG("{}: response {} has no waiting caller", _profile.name, msgid);

        return;
    }

    bool const is_request = type == msgtype::request;
    auto handler = _methods.find(frame_method(frame));

    if (not handler) {
        MPRPC_DEBUG("{}: no handler for '{}', dropped", _profile.name, frame_method(frame));
        _monitor->on_receive_warning(_profile, frame_state::warning_unknown_method_name);
        return;
    }

    if (is_request && std::holds_alternative<call_handler>(*handler)) {
        _pool->post(
                [this, fn = std::get<call_handler>(std::move(*handler)), frame = std::move(frame)]() mutable {
                    _handle_request(fn, std::move(frame));
                });
    } else if (not is_request && std::holds_alternative<notify_handler>(*handler)) {
        _pool->post(
                [this, fn = std::get<notify_handler>(std::move(*handler)), frame = std::move(frame)]() mutable {
                    _handle_notify(fn, std::move(frame));
                });
    } else {
        MPRPC_DEBUG("{}: '{}' is bound to other handler kind, dropped",
                    _profile.name, frame_method(frame));
        _monitor->on_receive_warning(_profile, frame_state::warning_handler_kind_mismatch);
    }
}

void client::_handle_request(call_handler const& handler, value frame) noexcept
{
    auto const msgid = frame_id(frame);
    rpc_result outcome;

    try {
        outcome = handler(std::move(frame_params(frame)));
    } catch (std::bad_alloc&) {
        MPRPC_ERROR("{}: out of memory in handler of request {}, no response", _profile.name, msgid);
        return;
    } catch (std::exception& e) {
        MPRPC_WARN("{}: handler '{}' threw: {}", _profile.name, frame_method(frame), e.what());
        _monitor->on_handler_error(_profile, e);

        try {
            outcome = rpc_result::error(e.what());
        } catch (std::bad_alloc&) {
            return;
        }
    } catch (...) {
        MPRPC_WARN("{}: handler '{}' threw non-standard exception", _profile.name, frame_method(frame));

        try {
            std::runtime_error error{"unknown exception"};
            _monitor->on_handler_error(_profile, error);
            outcome = rpc_result::error(error.what());
        } catch (std::bad_alloc&) {
            return;
        }
    }

    // Request is no longer needed.
    frame = nullptr;

    try {
        _outbound.enqueue(make_response(msgid, std::move(outcome)));
    } catch (std::bad_alloc&) {
        MPRPC_ERROR("{}: out of memory, response {} dropped", _profile.name, msgid);
    }
}

void client::_handle_notify(notify_handler const& handler, value frame) noexcept
{
    try {
        handler(std::move(frame_params(frame)));
    } catch (std::exception& e) {
        MPRPC_WARN("{}: handler '{}' threw: {}", _profile.name, frame_method(frame), e.what());
        _monitor->on_handler_error(_profile, e);
    } catch (...) {
        MPRPC_WARN("{}: handler '{}' threw non-standard exception", _profile.name, frame_method(frame));

        try {
            std::runtime_error error{"unknown exception"};
            _monitor->on_handler_error(_profile, error);
        } catch (std::bad_alloc&) {
            // Nothing left to report with
        }
    }
}
}  // namespace mprpc
