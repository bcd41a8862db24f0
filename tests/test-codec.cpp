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

#include <sstream>

#include <catch2/catch.hpp>

#include "mprpc/codec.hxx"
#include "mprpc/frame.hxx"

using namespace mprpc;

namespace {
std::string encode(value const& v)
{
    auto bytes = value::to_msgpack(v);
    return {bytes.begin(), bytes.end()};
}
}  // namespace

TEST_CASE("msgpack codec reads one value per call", "[codec]")
{
    codec::msgpack codec;
    std::stringbuf buf;

    codec.write(buf, make_request(1, "a", value::array({1})));
    codec.write(buf, make_notify("b", "text"));
    codec.write(buf, make_response(1, nullptr, value::object({{"k", 3.5}})));

    REQUIRE(codec.read(buf) == make_request(1, "a", value::array({1})));
    REQUIRE(codec.read(buf) == make_notify("b", "text"));
    REQUIRE(codec.read(buf) == make_response(1, nullptr, value::object({{"k", 3.5}})));

    // Nothing left
    REQUIRE_THROWS_AS(codec.read(buf), codec_error);
}

TEST_CASE("msgpack codec leaves trailing bytes untouched", "[codec]")
{
    codec::msgpack codec;

    auto first = encode(value::array({2, "x", nullptr}));
    auto second = encode(42);

    std::stringbuf buf{first + second};
    REQUIRE(codec.read(buf) == value::array({2, "x", nullptr}));
    REQUIRE(buf.in_avail() == std::streamsize(second.size()));
    REQUIRE(codec.read(buf) == 42);
}

TEST_CASE("msgpack codec rejects broken input", "[codec]")
{
    codec::msgpack codec;

    SECTION("truncated")
    {
        auto bytes = encode(make_request(1, "method", "a long enough parameter"));
        bytes.resize(bytes.size() / 2);

        std::stringbuf buf{bytes};
        REQUIRE_THROWS_AS(codec.read(buf), codec_error);
    }

    SECTION("reserved type byte")
    {
        std::stringbuf buf{std::string{"\xc1", 1}};
        REQUIRE_THROWS_AS(codec.read(buf), codec_error);
    }

    SECTION("valid value of unexpected shape is not a codec matter")
    {
        std::stringbuf buf{encode("just a string")};
        REQUIRE(codec.read(buf) == "just a string");
    }
}
