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
#include <condition_variable>
#include <mutex>
#include <utility>

namespace mprpc::thread {
/**
 * Condition variable bundled with the mutex it waits on.
 *
 * Every state change that a waiter's predicate observes must be done inside one of the
 * notify_xxx(critical) or critical_section() callbacks.
 */
class event_wait
{
   private:
    using mutex_type = std::mutex;
    using ulock_type = std::unique_lock<mutex_type>;

   private:
    mutable std::condition_variable _cvar;
    mutable mutex_type _mtx;

   public:
    template <typename Critical_>
    void notify_one(Critical_&& critical_proc)
    {
        ulock_type lc{_mtx};
        critical_proc();
        _cvar.notify_one();
    }

    template <typename Critical_>
    void notify_all(Critical_&& critical_proc)
    {
        ulock_type lc{_mtx};
        critical_proc();
        _cvar.notify_all();
    }

    void notify_one()
    {
        ulock_type lc{_mtx};
        _cvar.notify_one();
    }

    void notify_all()
    {
        ulock_type lc{_mtx};
        _cvar.notify_all();
    }

    template <typename Critical_>
    decltype(auto) critical_section(Critical_&& critical_proc) const
    {
        ulock_type lc{_mtx};
        return critical_proc();
    }

    template <typename Pred_>
    void wait(Pred_&& predicate) const
    {
        ulock_type lc{_mtx};
        _cvar.wait(lc, std::forward<Pred_>(predicate));
    }

    template <typename Duration_, typename Pred_>
    bool wait_for(Duration_&& duration, Pred_&& predicate) const
    {
        ulock_type lc{_mtx};
        return _cvar.wait_for(lc, std::forward<Duration_>(duration), std::forward<Pred_>(predicate));
    }
};
}  // namespace mprpc::thread
