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

#include "mprpc/codec.hxx"

#include <istream>

namespace mprpc::codec {
value msgpack::read(std::streambuf& in)
{
    std::istream is{&in};

    try {
        // Non-strict: stop right after the first complete value, leaving following bytes intact.
        return value::from_msgpack(is, false);
    } catch (value::exception& e) {
        throw codec_error{e.what()};
    }
}

void msgpack::write(std::streambuf& out, value const& frame)
{
    _wbuf.clear();
    value::to_msgpack(frame, _wbuf);

    auto const nbytes = std::streamsize(_wbuf.size());
    if (out.sputn(reinterpret_cast<char const*>(_wbuf.data()), nbytes) != nbytes)
        throw codec_error{"msgpack: stream rejected encoded bytes"};
}
}  // namespace mprpc::codec
