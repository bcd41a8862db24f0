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
#include <cstddef>

#include "event_wait.hxx"

namespace mprpc::thread {
/**
 * Counting wake-up signal.
 */
class semaphore
{
    event_wait _event;
    size_t _count = 0;

   public:
    explicit semaphore(size_t initial = 0) noexcept : _count(initial) {}

   public:
    void post()
    {
        _event.notify_one([&] { ++_count; });
    }

    void wait()
    {
        // Decrement must happen under the same lock the predicate was checked with.
        _event.wait([&] { return _count > 0 && (--_count, true); });
    }

    bool try_wait()
    {
        return _event.critical_section([&] {
            if (_count == 0) { return false; }
            return --_count, true;
        });
    }

    template <typename Duration_>
    bool wait_for(Duration_&& duration)
    {
        return _event.wait_for(
                std::forward<Duration_>(duration),
                [&] { return _count > 0 && (--_count, true); });
    }

    size_t count() const
    {
        return _event.critical_section([&] { return _count; });
    }
};
}  // namespace mprpc::thread
