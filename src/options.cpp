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

#include "mprpc/options.hxx"

#include <algorithm>

namespace mprpc {
void to_json(value& out, client_options const& opts)
{
    out = value::object();
    out["num_dispatch_workers"] = opts.num_dispatch_workers;
    out["poll_interval_ms"] = opts.poll_interval.count();
    out["name"] = opts.name;
}

void from_json(value const& in, client_options& opts)
{
    if (auto iter = in.find("num_dispatch_workers"); iter != in.end()) {
        // Negative or zero count falls back to a single worker.
        auto const num_workers = iter->get<int64_t>();
        opts.num_dispatch_workers = num_workers < 1 ? 1 : size_t(num_workers);
    }

    if (auto iter = in.find("poll_interval_ms"); iter != in.end())
        opts.poll_interval = std::chrono::milliseconds{std::max<int64_t>(0, iter->get<int64_t>())};

    if (auto iter = in.find("name"); iter != in.end())
        iter->get_to(opts.name);
}
}  // namespace mprpc
