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
#include <deque>
#include <functional>
#include <stdexcept>
#include <thread>
#include <vector>

#include "event_wait.hxx"

namespace mprpc {
/**
 * Fixed set of threads executing posted tasks in FIFO order.
 *
 * Tasks are allowed to block for a long time (the client's reader/writer loops do), hence the
 *  pool must be sized with those long-lived tasks taken into account.
 */
class worker_pool
{
    using task_type = std::function<void()>;

   private:
    thread::event_wait _event;
    std::deque<task_type> _tasks;
    size_t _num_running = 0;
    bool _stopped = false;

    std::vector<std::thread> _workers;

   public:
    explicit worker_pool(size_t num_threads = std::thread::hardware_concurrency());
    ~worker_pool();

    worker_pool(worker_pool const&) = delete;
    worker_pool& operator=(worker_pool const&) = delete;

   public:
    /**
     * Enqueue a task. Throws std::logic_error after shutdown().
     *
     * Task must not throw: an exception escaping a worker thread terminates the process.
     */
    template <typename Message_>
    void post(Message_&& msg)
    {
        // wait_idle() shares the condition; notify_one() could wake it instead of a worker.
        bool rejected = false;
        _event.notify_all([&] {
            if (_stopped)
                rejected = true;
            else
                _tasks.emplace_back(std::forward<Message_>(msg));
        });

        if (rejected) { throw std::logic_error{"worker_pool: post after shutdown"}; }
    }

    /**
     * Block until no task is queued or running.
     */
    void wait_idle();

    /**
     * Wait until idle, then stop and join every worker. Safe to call more than once.
     */
    void shutdown();

    size_t size() const noexcept { return _workers.size(); }

    size_t num_pending() const
    {
        return _event.critical_section([&] { return _tasks.size() + _num_running; });
    }

   private:
    void _worker_fn();
};
}  // namespace mprpc
