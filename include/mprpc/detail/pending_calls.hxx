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
#include <mutex>
#include <unordered_map>

#include "../defs.hxx"
#include "../thread/wait_flag.hxx"

namespace mprpc::detail {
/**
 * Request id to wait flag of the blocked caller.
 *
 * Entries are created right before a request is sent and removed by the same caller after its
 *  flag was observed set.
 */
class pending_calls
{
    using flag_ptr = shared_ptr<thread::wait_flag>;

    mutable std::mutex _mtx;
    std::unordered_map<msgid_t, flag_ptr> _table;

   public:
    /**
     * @throw rpc_exception(errc::duplicate_id) if id is already pending.
     */
    flag_ptr add(msgid_t id)
    {
        auto flag = make_shared<thread::wait_flag>();

        std::lock_guard _{_mtx};
        if (not _table.try_emplace(id, flag).second)
            throw rpc_exception{errc::duplicate_id, "msgid " + std::to_string(id)};

        return flag;
    }

    /**
     * Set flag of given id, if present. The entry is kept.
     */
    bool signal(msgid_t id)
    {
        flag_ptr flag;
        {
            std::lock_guard _{_mtx};

            auto iter = _table.find(id);
            if (iter == _table.end()) { return false; }
            flag = iter->second;
        }

        flag->set();
        return true;
    }

    void remove(msgid_t id)
    {
        std::lock_guard _{_mtx};
        _table.erase(id);
    }

    bool contains(msgid_t id) const
    {
        std::lock_guard _{_mtx};
        return _table.find(id) != _table.end();
    }

    size_t size() const
    {
        std::lock_guard _{_mtx};
        return _table.size();
    }
};
}  // namespace mprpc::detail
