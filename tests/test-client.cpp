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

#include <algorithm>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include <catch2/catch.hpp>

#include "mprpc/client.hxx"
#include "mprpc/client_builder.hxx"
#include "mprpc/frame.hxx"
#include "mprpc/transport/inmemory_pipe.hxx"

using namespace mprpc;
using namespace std::literals;

namespace {
class recording_monitor : public if_client_monitor
{
    mutable std::mutex _mtx;
    std::vector<frame_state> _warnings;

   public:
    std::atomic_int nstarted = 0;
    std::atomic_int nstopped = 0;
    std::atomic_int nhandler_errors = 0;
    std::atomic_int nreader_expired = 0;
    std::atomic_int nwriter_expired = 0;

   public:
    void on_client_started(client_profile const&) override { ++nstarted; }
    void on_client_stopped(client_profile const&) override { ++nstopped; }

    void on_receive_warning(client_profile const&, frame_state state) override
    {
        std::lock_guard _{_mtx};
        _warnings.push_back(state);
    }

    void on_handler_error(client_profile const&, std::exception&) override { ++nhandler_errors; }
    void on_reader_expired(client_profile const&, std::exception&) override { ++nreader_expired; }
    void on_writer_expired(client_profile const&, std::exception&) override { ++nwriter_expired; }

    size_t num_warnings(frame_state state) const
    {
        std::lock_guard _{_mtx};
        return std::count(_warnings.begin(), _warnings.end(), state);
    }

    size_t num_warnings() const
    {
        std::lock_guard _{_mtx};
        return _warnings.size();
    }
};

template <typename Pred_>
bool wait_until(Pred_&& pred)
{
    for (int i = 0; i < 5000; ++i) {
        if (pred()) { return true; }
        std::this_thread::sleep_for(1ms);
    }

    return pred();
}

/**
 * Client on one end of an in-memory pipe, a raw msgpack peer on the other.
 */
struct client_fixture {
    shared_ptr<recording_monitor> monitor = make_shared<recording_monitor>();
    unique_ptr<transport::inmemory_pipe> peer;
    client_ptr cl;
    codec::msgpack peer_codec;

    client_fixture()
    {
        auto endpoints = transport::inmemory_pipe::create();
        peer = std::move(endpoints.second);

        client_options opts;
        opts.name = "test-client";
        opts.num_dispatch_workers = 4;

        cl = client::builder{}
                     .transport(std::move(endpoints.first))
                     .monitor(monitor)
                     .options(opts)
                     .build();
    }

    // Catch assertions are not thread safe; peer threads check the return value instead.
    bool send(value const& frame)
    {
        peer_codec.write(*peer->writer(), frame);
        return peer->writer()->pubsync() == 0;
    }

    value recv()
    {
        return peer_codec.read(*peer->reader());
    }
};
}  // namespace

TEST_CASE("client lifecycle", "[client]")
{
    client_fixture fx;
    auto& cl = *fx.cl;

    REQUIRE(not cl.running());
    REQUIRE(cl.profile().name == "test-client");
    REQUIRE(cl.profile().peer_name == "inmemory:a");
    REQUIRE(cl.options().num_dispatch_workers == 4);

    cl.start();
    REQUIRE(cl.running());
    REQUIRE(wait_until([&] { return cl.reader_alive() && cl.writer_alive(); }));
    REQUIRE(fx.monitor->nstarted == 1);
    REQUIRE_THROWS_AS(cl.start(), std::logic_error);

    cl.stop();
    cl.stop();
    REQUIRE(not cl.running());
    REQUIRE(fx.monitor->nstopped == 1);
    REQUIRE(wait_until([&] { return not cl.reader_alive() && not cl.writer_alive(); }));
    REQUIRE_THROWS_AS(cl.start(), std::logic_error);

    SECTION("stopped client refuses to send")
    {
        REQUIRE(not cl.notify("anything", 1));

        try {
            cl.call("anything", 1);
            FAIL("call() on stopped client must throw");
        } catch (rpc_exception& e) {
            REQUIRE(e.code() == errc::client_stopped);
        }

        REQUIRE(cl.num_pending_calls() == 0);
        REQUIRE(cl.num_queued_frames() == 0);
    }
}

TEST_CASE("client builder disposal", "[client]")
{
    SECTION("transport factory throws inside builder chain")
    {
        auto failing_transport = []() -> transport_ptr {
            throw std::runtime_error{"transport unavailable"};
        };

        client_ptr cl;
        REQUIRE_THROWS_AS(cl = client::builder{}.transport(failing_transport()).build(), std::runtime_error);
        REQUIRE(not cl);
    }

    SECTION("builder dropped after transport was set")
    {
        auto endpoints = transport::inmemory_pipe::create();
        {
            client::builder builder;
            builder.transport(std::move(endpoints.first));
        }

        // The unbuilt client released its endpoint, which closed the pipe.
        REQUIRE(endpoints.second->readable());
        REQUIRE(endpoints.second->reader()->sgetc() == std::streambuf::traits_type::eof());
    }

    SECTION("build_to replaces previous client")
    {
        auto first = transport::inmemory_pipe::create();
        auto second = transport::inmemory_pipe::create();

        client_ptr cl;
        client::builder{}.transport(std::move(first.first)).build_to(cl);
        REQUIRE(cl);
        auto const first_id = cl->profile().local_id;

        client::builder{}.transport(std::move(second.first)).build_to(cl);
        REQUIRE(cl);
        REQUIRE(cl->profile().local_id != first_id);

        // The first client was disposed, closing its end.
        REQUIRE(first.second->readable());
        REQUIRE(first.second->reader()->sgetc() == std::streambuf::traits_type::eof());
    }
}

TEST_CASE("client correlates concurrent calls", "[client]")
{
    client_fixture fx;
    fx.cl->start();

    constexpr int num_callers = 8;

    // Answers every request only after all of them arrived, in reverse order.
    std::atomic_bool peer_ok = true;
    std::thread peer{[&] {
        std::vector<value> requests;
        while (requests.size() < num_callers)
            requests.push_back(fx.recv());

        std::reverse(requests.begin(), requests.end());
        for (auto& req : requests) {
            if (frame_type(req) != msgtype::request || frame_method(req) != "echo")
                peer_ok = false;
            if (not fx.send(make_response(frame_id(req), nullptr, frame_params(req))))
                peer_ok = false;
        }
    }};

    std::vector<int> results(num_callers, -1);
    std::vector<std::thread> callers;

    for (int i = 0; i < num_callers; ++i) {
        callers.emplace_back([&, i] {
            auto r = fx.cl->call("echo", value::array({i, "payload"}));
            if (r && r.get()[0] == i) { results[i] = i; }
        });
    }

    for (auto& th : callers) { th.join(); }
    peer.join();

    REQUIRE(peer_ok);
    for (int i = 0; i < num_callers; ++i) { REQUIRE(results[i] == i); }
    REQUIRE(fx.cl->num_pending_calls() == 0);
    REQUIRE(fx.cl->num_buffered_responses() == 0);

    size_t nread = 0, nwrite = 0;
    fx.cl->totals(&nread, &nwrite);
    REQUIRE(nread > 0);
    REQUIRE(nwrite > 0);
}

TEST_CASE("client delivers remote errors as results", "[client]")
{
    client_fixture fx;
    fx.cl->start();

    std::atomic_bool peer_ok = false;
    std::thread peer{[&] {
        auto req = fx.recv();
        peer_ok = fx.send(make_response(frame_id(req), value::array({-32601, "no such method"}), nullptr));
    }};

    auto r = fx.cl->call("missing", nullptr);
    peer.join();

    REQUIRE(peer_ok);
    REQUIRE(r.is_error());
    REQUIRE(r.get()[1] == "no such method");
}

TEST_CASE("client keeps unmatched responses buffered", "[client]")
{
    client_fixture fx;
    fx.cl->start();

    REQUIRE(fx.send(make_response(999, nullptr, "noise")));
    REQUIRE(wait_until([&] { return fx.cl->num_buffered_responses() == 1; }));
    REQUIRE(fx.monitor->num_warnings() == 0);

    std::atomic_bool peer_ok = false;
    std::thread peer{[&] {
        auto req = fx.recv();
        peer_ok = fx.send(make_response(frame_id(req), nullptr, "signal"));
    }};

    auto r = fx.cl->call("ping", nullptr);
    peer.join();

    REQUIRE(peer_ok);
    REQUIRE(r.get() == "signal");
    REQUIRE(fx.cl->num_buffered_responses() == 1);
}

TEST_CASE("client dispatches inbound requests and notifications", "[client]")
{
    client_fixture fx;
    auto& cl = *fx.cl;

    std::atomic_int ncalls = 0;
    std::atomic_int nticks = 0;

    cl.register_call_method("add", [&](value params) {
        ++ncalls;
        return rpc_result::ok(params[0].get<int>() + params[1].get<int>());
    });
    cl.register_call_method("fail", [](value) -> rpc_result {
        throw std::runtime_error{"handler failure"};
    });
    cl.register_notify_method("tick", [&](value) { ++nticks; });
    cl.register_call_method("fail_odd", [](value) -> rpc_result { throw 42; });
    cl.register_notify_method("tick_odd", [](value) { throw 42; });

    cl.start();

    SECTION("request is answered exactly once")
    {
        REQUIRE(fx.send(make_request(5, "add", value::array({2, 3}))));
        REQUIRE(fx.recv() == make_response(5, nullptr, 5));

        REQUIRE(fx.send(make_request(6, "add", value::array({4, 4}))));
        REQUIRE(fx.recv() == make_response(6, nullptr, 8));
        REQUIRE(ncalls == 2);
    }

    SECTION("back-to-back requests are each answered once")
    {
        constexpr int num_requests = 50;

        for (int i = 0; i < num_requests; ++i)
            REQUIRE(fx.send(make_request(100 + i, "add", value::array({i, 1}))));

        std::set<msgid_t> answered;
        for (int i = 0; i < num_requests; ++i) {
            auto rep = fx.recv();
            REQUIRE(frame_type(rep) == msgtype::response);

            auto const id = frame_id(rep);
            REQUIRE(rep[3] == int(id - 100) + 1);
            answered.insert(id);
        }

        REQUIRE(answered.size() == num_requests);
        REQUIRE(*answered.begin() == 100);
        REQUIRE(*answered.rbegin() == 100 + num_requests - 1);

        std::this_thread::sleep_for(20ms);
        REQUIRE(ncalls == num_requests);
        REQUIRE(cl.num_queued_frames() == 0);
    }

    SECTION("each notification reaches its handler once")
    {
        for (int i = 0; i < 20; ++i) { REQUIRE(fx.send(make_notify("tick", i))); }

        REQUIRE(wait_until([&] { return nticks == 20; }));
        std::this_thread::sleep_for(20ms);
        REQUIRE(nticks == 20);
    }

    SECTION("handler exception becomes error response")
    {
        REQUIRE(fx.send(make_request(3, "fail", value::array())));
        REQUIRE(fx.recv() == make_response(3, "handler failure", nullptr));
        REQUIRE(fx.monitor->nhandler_errors == 1);
        REQUIRE(cl.reader_alive());
    }

    SECTION("non-standard exception from handler")
    {
        REQUIRE(fx.send(make_request(21, "fail_odd", value::array())));
        REQUIRE(fx.recv() == make_response(21, "unknown exception", nullptr));

        REQUIRE(fx.send(make_notify("tick_odd", nullptr)));
        REQUIRE(wait_until([&] { return fx.monitor->nhandler_errors == 2; }));

        // Reader and workers survive both.
        REQUIRE(fx.send(make_request(22, "add", value::array({1, 2}))));
        REQUIRE(fx.recv() == make_response(22, nullptr, 3));
    }

    SECTION("unroutable frames are dropped silently")
    {
        REQUIRE(fx.send(make_request(1, "missing", value::array())));
        REQUIRE(fx.send(make_notify("add", value::array({1, 1}))));
        REQUIRE(fx.send(make_request(2, "tick", value::array())));

        // Nothing is answered for the three above; next response belongs to this one.
        REQUIRE(fx.send(make_request(4, "add", value::array({1, 1}))));
        REQUIRE(fx.recv() == make_response(4, nullptr, 2));

        REQUIRE(fx.monitor->num_warnings(frame_state::warning_unknown_method_name) == 1);
        REQUIRE(fx.monitor->num_warnings(frame_state::warning_handler_kind_mismatch) == 2);
        REQUIRE(ncalls == 1);
        REQUIRE(nticks == 0);
    }

    SECTION("malformed frames do not stop the reader")
    {
        REQUIRE(fx.send(value::array({1, 2})));
        REQUIRE(fx.send(value::array({0, 1, "add", value::array({1, 1}), "extra"})));
        REQUIRE(fx.send("not even an array"));
        REQUIRE(fx.send(value::array({7, 1, "add", value::array({1, 1})})));

        REQUIRE(fx.send(make_request(9, "add", value::array({20, 22}))));
        REQUIRE(fx.recv() == make_response(9, nullptr, 42));

        REQUIRE(fx.monitor->num_warnings(frame_state::warning_invalid_format) == 3);
        REQUIRE(fx.monitor->num_warnings(frame_state::warning_invalid_message_type) == 1);
        REQUIRE(cl.reader_alive());
        REQUIRE(ncalls == 1);
    }

    SECTION("re-registration replaces handler")
    {
        cl.register_call_method("add", [](value) { return rpc_result::ok("replaced"); });

        REQUIRE(fx.send(make_request(11, "add", value::array({1, 1}))));
        REQUIRE(fx.recv() == make_response(11, nullptr, "replaced"));
        REQUIRE(ncalls == 0);
    }
}

TEST_CASE("client sends notifications without pending entries", "[client]")
{
    client_fixture fx;

    SECTION("queued before start")
    {
        REQUIRE(fx.cl->notify("early", 1));
        REQUIRE(fx.cl->num_queued_frames() == 1);

        fx.cl->start();
        REQUIRE(fx.recv() == make_notify("early", 1));
    }

    SECTION("after start")
    {
        fx.cl->start();

        REQUIRE(fx.cl->notify("log", value::object({{"level", "info"}})));
        REQUIRE(fx.cl->num_pending_calls() == 0);
        REQUIRE(fx.recv() == make_notify("log", value::object({{"level", "info"}})));
    }
}

TEST_CASE("client reports transport expiration", "[client]")
{
    client_fixture fx;
    fx.cl->start();

    fx.peer.reset();

    REQUIRE(wait_until([&] { return not fx.cl->reader_alive(); }));
    REQUIRE(fx.monitor->nreader_expired == 1);

    // The writer only notices on its next flush.
    REQUIRE(fx.cl->notify("lost", nullptr));
    REQUIRE(wait_until([&] { return not fx.cl->writer_alive(); }));
    REQUIRE(fx.monitor->nwriter_expired == 1);

    REQUIRE(not fx.cl->notify("lost", nullptr));
    REQUIRE_THROWS_AS(fx.cl->call("lost", nullptr), rpc_exception);
}
