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

#include "mprpc/thread/worker_pool.hxx"

#include "mprpc/helper/macros.hxx"

namespace mprpc {
worker_pool::worker_pool(size_t num_threads)
{
    if (num_threads == 0) { num_threads = 1; }

    _workers.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i)
        _workers.emplace_back(&worker_pool::_worker_fn, this);
}

worker_pool::~worker_pool()
{
    shutdown();
}

void worker_pool::wait_idle()
{
    _event.wait([&] { return _tasks.empty() && _num_running == 0; });
}

void worker_pool::shutdown()
{
    wait_idle();
    _event.notify_all([&] { _stopped = true; });

    for (auto& th : _workers) {
        if (th.joinable()) { th.join(); }
    }
}

void worker_pool::_worker_fn()
{
    for (;;) {
        task_type task;

        _event.wait([&] { return _stopped || not _tasks.empty(); });
        bool const fetched = _event.critical_section([&] {
            if (_tasks.empty()) { return false; }

            task = std::move(_tasks.front());
            _tasks.pop_front();
            ++_num_running;
            return true;
        });

        if (not fetched) {
            if (_event.critical_section([&] { return _stopped; }))
                return;

            continue;
        }

        MPRPC_FINALLY(_event.notify_all([&] { --_num_running; }));
        task();
        task = {};
    }
}
}  // namespace mprpc
