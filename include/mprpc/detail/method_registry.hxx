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
#include <map>
#include <mutex>
#include <optional>
#include <variant>

#include "../defs.hxx"

namespace mprpc::detail {
using handler_type = std::variant<call_handler, notify_handler>;

/**
 * Method name to handler mapping. Re-registration overwrites.
 */
class method_registry
{
    mutable std::mutex _mtx;
    std::map<string, handler_type, std::less<>> _table;

   public:
    void add(string name, handler_type handler)
    {
        std::lock_guard _{_mtx};
        _table.insert_or_assign(std::move(name), std::move(handler));
    }

    /**
     * Returns copy of handler, so that it can be invoked out of lock.
     */
    std::optional<handler_type> find(string_view name) const
    {
        std::lock_guard _{_mtx};

        auto iter = _table.find(name);
        if (iter == _table.end()) { return {}; }

        return iter->second;
    }

    size_t size() const
    {
        std::lock_guard _{_mtx};
        return _table.size();
    }
};
}  // namespace mprpc::detail
