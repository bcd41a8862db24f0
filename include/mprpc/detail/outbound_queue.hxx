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
#include <mutex>
#include <optional>

#include "../thread/semaphore.hxx"
#include "../value.hxx"

namespace mprpc::detail {
/**
 * Frames waiting for the writer, with a counting signal that parks the writer while idle.
 *
 * Each enqueue() posts the signal once. The signal may also be posted without a frame, to make
 *  the writer re-check its exit condition.
 */
class outbound_queue
{
    mutable std::mutex _mtx;
    std::deque<value> _queue;
    thread::semaphore _signal;

   public:
    void enqueue(value frame)
    {
        {
            std::lock_guard _{_mtx};
            _queue.push_back(std::move(frame));
        }

        _signal.post();
    }

    std::optional<value> dequeue()
    {
        std::lock_guard _{_mtx};
        if (_queue.empty()) { return {}; }

        std::optional<value> frame{std::move(_queue.front())};
        _queue.pop_front();
        return frame;
    }

    void wait_signal() { _signal.wait(); }
    void post_signal() { _signal.post(); }

    size_t size() const
    {
        std::lock_guard _{_mtx};
        return _queue.size();
    }
};
}  // namespace mprpc::detail
