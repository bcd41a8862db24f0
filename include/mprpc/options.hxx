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
#include <chrono>

#include "defs.hxx"

namespace mprpc {
struct client_options {
    // Threads serving inbound handlers. The reader and writer loop get two more on top of this.
    size_t num_dispatch_workers = 2;

    // Reader's sleep while the transport has nothing to read.
    std::chrono::milliseconds poll_interval{1};

    // Label in log lines
    string name = "mprpc";
};

/**
 * JSON form: {"num_dispatch_workers": 2, "poll_interval_ms": 1, "name": "mprpc"}
 *
 * Missing keys keep their defaults, unknown keys are ignored.
 */
void to_json(value& out, client_options const& opts);
void from_json(value const& in, client_options& opts);
}  // namespace mprpc
