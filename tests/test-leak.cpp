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

#include <atomic>
#include <cstdlib>
#include <new>
#include <thread>

#include <catch2/catch.hpp>

#include "mprpc/client.hxx"
#include "mprpc/client_builder.hxx"
#include "mprpc/codec.hxx"
#include "mprpc/frame.hxx"
#include "mprpc/transport/inmemory_pipe.hxx"

namespace {
std::atomic_long g_num_live_allocs = 0;
}

void* operator new(std::size_t size)
{
    if (auto p = std::malloc(size ? size : 1)) {
        ++g_num_live_allocs;
        return p;
    }

    throw std::bad_alloc{};
}

void* operator new(std::size_t size, std::nothrow_t const&) noexcept
{
    auto p = std::malloc(size ? size : 1);
    if (p) { ++g_num_live_allocs; }
    return p;
}

void operator delete(void* p) noexcept
{
    if (p) {
        --g_num_live_allocs;
        std::free(p);
    }
}

void operator delete(void* p, std::size_t) noexcept { operator delete(p); }
void operator delete(void* p, std::nothrow_t const&) noexcept { operator delete(p); }

using namespace mprpc;
using namespace std::literals;

namespace {
template <typename Pred_>
bool wait_until(Pred_&& pred)
{
    for (int i = 0; i < 5000; ++i) {
        if (pred()) { return true; }
        std::this_thread::sleep_for(1ms);
    }

    return pred();
}

client_ptr make_client(unique_ptr<transport::inmemory_pipe> endpoint)
{
    auto cl = client::builder{}.transport(std::move(endpoint)).build();
    cl->register_call_method("echo", [](value params) { return rpc_result::ok(std::move(params)); });
    cl->register_notify_method("sink", [](value) {});
    return cl;
}

// Frames never sent and never claimed are released with the client.
bool run_unstarted_scenario()
{
    auto endpoints = transport::inmemory_pipe::create();
    auto cl = make_client(std::move(endpoints.first));

    bool ok = true;
    for (int i = 0; i < 16; ++i)
        ok = cl->notify("queued", value::array({i, std::string(100, 'q')})) && ok;

    ok = ok && cl->num_queued_frames() == 16;
    return ok;
}

bool run_started_scenario()
{
    auto endpoints = transport::inmemory_pipe::create();
    auto peer = std::move(endpoints.second);
    auto cl = make_client(std::move(endpoints.first));
    codec::msgpack peer_codec;

    cl->start();

    for (msgid_t id = 100; id < 110; ++id)
        peer_codec.write(*peer->writer(), make_response(id, nullptr, std::string(64, 'r')));

    peer_codec.write(*peer->writer(), make_request(1, "echo", value::array({"hello"})));
    peer_codec.write(*peer->writer(), make_notify("sink", 1));
    peer_codec.write(*peer->writer(), value::array({9, 9}));
    bool ok = peer->writer()->pubsync() == 0;

    ok = wait_until([&] { return cl->num_buffered_responses() == 10; }) && ok;
    ok = peer_codec.read(*peer->reader()) == make_response(1, nullptr, value::array({"hello"})) && ok;

    for (int i = 0; i < 8; ++i)
        ok = cl->notify("tail", i) && ok;

    cl->stop();
    cl.reset();
    return ok;
}
}  // namespace

TEST_CASE("client releases every frame it holds on disposal", "[client][leak]")
{
    // Static state (default logger, spdlog registry) is created once, ahead of the baseline.
    bool const warmup_ok = run_started_scenario();
    REQUIRE(warmup_ok);

    auto const baseline = g_num_live_allocs.load();

    bool const unstarted_ok = run_unstarted_scenario();
    bool const started_ok = run_started_scenario();

    auto const remaining = g_num_live_allocs.load();

    REQUIRE(unstarted_ok);
    REQUIRE(started_ok);
    REQUIRE(remaining == baseline);
}
