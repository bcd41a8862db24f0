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
#include <algorithm>
#include <deque>
#include <mutex>
#include <optional>

#include "../frame.hxx"

namespace mprpc::detail {
/**
 * Received responses not yet claimed by their caller, in arrival order.
 *
 * Only inspected response frames may be pushed.
 */
class response_buffer
{
    mutable std::mutex _mtx;
    std::deque<value> _queue;

   public:
    void push(value frame)
    {
        std::lock_guard _{_mtx};
        _queue.push_back(std::move(frame));
    }

    /**
     * Remove and return the first response with given id. Order of the remaining entries is
     *  preserved; on miss the buffer is left untouched.
     */
    std::optional<value> take_matching(msgid_t id)
    {
        std::lock_guard _{_mtx};

        auto iter = std::find_if(
                _queue.begin(), _queue.end(),
                [id](value const& frame) { return frame_id(frame) == id; });

        if (iter == _queue.end()) { return {}; }

        std::optional<value> taken{std::move(*iter)};
        _queue.erase(iter);
        return taken;
    }

    size_t size() const
    {
        std::lock_guard _{_mtx};
        return _queue.size();
    }
};
}  // namespace mprpc::detail
