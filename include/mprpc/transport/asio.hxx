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
#include <atomic>
#include <string>
#include <vector>

#include <asio/basic_stream_socket.hpp>
#include <asio/buffer.hpp>
#include <asio/socket_base.hpp>
#include <poll.h>

#include "../transport.hxx"

namespace mprpc::transport {
namespace _detail {
/**
 * One half of a socket. Synchronous receive/send on the same socket are thread safe with
 *  respect to each other, which lets the reader and writer loop use both halves concurrently.
 */
template <typename Socket>
class asio_half_streambuf : public std::streambuf
{
    Socket* _sock;
    std::vector<char> _buf;

   public:
    std::atomic_size_t ntotal = 0;

   public:
    asio_half_streambuf(Socket* sock, size_t buffer_size)
            : _sock(sock),
              _buf(buffer_size ? buffer_size : 1)
    {
        setg(_buf.data(), _buf.data(), _buf.data());
        setp(_buf.data(), _buf.data() + _buf.size());
    }

    bool has_buffered() const noexcept { return gptr() < egptr(); }

   protected:
    int_type underflow() override
    {
        if (gptr() < egptr()) { return traits_type::to_int_type(*gptr()); }

        asio::error_code ec;
        auto nread = _sock->receive(asio::buffer(_buf.data(), _buf.size()), 0, ec);
        if (ec || nread == 0) { return traits_type::eof(); }

        ntotal.fetch_add(nread, std::memory_order_relaxed);
        setg(_buf.data(), _buf.data(), _buf.data() + nread);
        return traits_type::to_int_type(*gptr());
    }

    int_type overflow(int_type ch) override
    {
        if (not _flush_all())
            return traits_type::eof();

        if (not traits_type::eq_int_type(ch, traits_type::eof())) {
            *pptr() = traits_type::to_char_type(ch);
            pbump(1);
        }

        return traits_type::not_eof(ch);
    }

    int sync() override
    {
        return _flush_all() ? 0 : -1;
    }

   private:
    bool _flush_all()
    {
        auto begin = pbase();
        auto const end = pptr();

        while (begin < end) {
            asio::error_code ec;
            auto nwrite = _sock->send(asio::buffer(begin, size_t(end - begin)), 0, ec);
            if (ec) { return false; }

            begin += nwrite;
            ntotal.fetch_add(nwrite, std::memory_order_relaxed);
        }

        setp(_buf.data(), _buf.data() + _buf.size());
        return true;
    }
};
}  // namespace _detail

/**
 * Transport over a connected asio stream socket (tcp, local::stream_protocol).
 */
template <typename Protocol>
class asio_stream : public if_transport
{
    using protocol_type = Protocol;
    using socket_type = typename Protocol::socket;
    using half_type = _detail::asio_half_streambuf<socket_type>;

   private:
    socket_type _sock;
    half_type _in;
    half_type _out;
    std::atomic_bool _closed = false;

   public:
    explicit asio_stream(socket_type&& socket, size_t buffer_size = 4096)
            : if_transport(&_in, &_out, _ep_to_string(socket)),
              _sock(std::move(socket)),
              _in(&_sock, buffer_size),
              _out(&_sock, buffer_size)
    {
    }

    ~asio_stream() override
    {
        asio_stream::close();
    }

   public:
    bool readable() noexcept override
    {
        if (_in.has_buffered() || _closed.load(std::memory_order_acquire)) { return true; }

        asio::error_code ec;
        auto navail = _sock.available(ec);
        if (ec || navail > 0) { return true; }  // Errors are reported by the following receive.

        // available() reports zero both for an idle socket and for an orderly shutdown by peer.
        pollfd pfd = {};
        pfd.fd = _sock.native_handle();
        pfd.events = POLLIN;

        return ::poll(&pfd, 1, 0) > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR));
    }

    void close() noexcept override
    {
        if (_closed.exchange(true)) { return; }

        asio::error_code ec;
        _sock.shutdown(asio::socket_base::shutdown_both, ec);
    }

    void get_total_rw(size_t* num_read, size_t* num_write) override
    {
        *num_read = _in.ntotal.load(std::memory_order_relaxed);
        *num_write = _out.ntotal.load(std::memory_order_relaxed);
    }

    socket_type& socket() noexcept { return _sock; }

   private:
    static std::string _ep_to_string(socket_type const& socket)
    {
        asio::error_code ec;
        auto ep = socket.remote_endpoint(ec);
        if (ec) { return "asio:unknown"; }

        return _format_endpoint(ep);
    }

    template <typename Endpoint>
    static auto _format_endpoint(Endpoint const& ep) -> decltype(ep.address(), std::string{})
    {
        return ep.address().to_string() + ":" + std::to_string(ep.port());
    }

    template <typename Endpoint>
    static auto _format_endpoint(Endpoint const& ep) -> decltype(ep.path(), std::string{})
    {
        return "unix:" + ep.path();
    }
};

template <typename StreamSock>
asio_stream(StreamSock&& sock) -> asio_stream<typename std::decay_t<StreamSock>::protocol_type>;
}  // namespace mprpc::transport
