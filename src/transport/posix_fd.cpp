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

#include "mprpc/transport/posix_fd.hxx"

#include <cerrno>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace mprpc::transport {
posix_fd::fd_streambuf::fd_streambuf(int fd, size_t buffer_size)
        : _fd(fd),
          _buf(buffer_size ? buffer_size : 1)
{
    setg(_buf.data(), _buf.data(), _buf.data());
    setp(_buf.data(), _buf.data() + _buf.size());
}

auto posix_fd::fd_streambuf::underflow() -> int_type
{
    if (gptr() < egptr()) { return traits_type::to_int_type(*gptr()); }
    if (_closed.load(std::memory_order_acquire)) { return traits_type::eof(); }

    ssize_t nread;
    do {
        nread = ::read(_fd, _buf.data(), _buf.size());
    } while (nread < 0 && errno == EINTR);

    if (nread <= 0)
        return traits_type::eof();

    _ntotal.fetch_add(size_t(nread), std::memory_order_relaxed);
    setg(_buf.data(), _buf.data(), _buf.data() + nread);
    return traits_type::to_int_type(*gptr());
}

auto posix_fd::fd_streambuf::overflow(int_type ch) -> int_type
{
    if (not _flush_all())
        return traits_type::eof();

    if (not traits_type::eq_int_type(ch, traits_type::eof())) {
        *pptr() = traits_type::to_char_type(ch);
        pbump(1);
    }

    return traits_type::not_eof(ch);
}

int posix_fd::fd_streambuf::sync()
{
    return _flush_all() ? 0 : -1;
}

bool posix_fd::fd_streambuf::_flush_all()
{
    auto begin = pbase();
    auto const end = pptr();

    while (begin < end) {
        if (_closed.load(std::memory_order_acquire)) { return false; }

        ssize_t nwrite = -1;
        if (_is_socket) {
            nwrite = ::send(_fd, begin, size_t(end - begin), MSG_NOSIGNAL);
            if (nwrite < 0 && errno == ENOTSOCK) {
                _is_socket = false;
                continue;
            }
        } else {
            nwrite = ::write(_fd, begin, size_t(end - begin));
        }

        if (nwrite < 0) {
            if (errno == EINTR) { continue; }
            return false;
        }

        begin += nwrite;
        _ntotal.fetch_add(size_t(nwrite), std::memory_order_relaxed);
    }

    setp(_buf.data(), _buf.data() + _buf.size());
    return true;
}

bool posix_fd::fd_streambuf::_readable() noexcept
{
    if (gptr() < egptr()) { return true; }
    if (_closed.load(std::memory_order_acquire)) { return true; }

    pollfd pfd = {};
    pfd.fd = _fd;
    pfd.events = POLLIN;

    int rc;
    do {
        rc = ::poll(&pfd, 1, 0);
    } while (rc < 0 && errno == EINTR);

    // Hang-up and errors count as readable; the following read reports end of stream.
    return rc > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR | POLLNVAL));
}

posix_fd::posix_fd(int fd, bool owns, size_t buffer_size)
        : posix_fd(fd, fd, owns, buffer_size)
{
}

posix_fd::posix_fd(int in_fd, int out_fd, bool owns, size_t buffer_size)
        : if_transport(&_in, &_out, "fd:" + std::to_string(in_fd) + "/" + std::to_string(out_fd)),
          _in(in_fd, buffer_size),
          _out(out_fd, buffer_size),
          _owns(owns)
{
}

posix_fd::~posix_fd()
{
    posix_fd::close();

    if (_owns) {
        ::close(_in._fd);
        if (_out._fd != _in._fd) { ::close(_out._fd); }
    }
}

std::unique_ptr<posix_fd> posix_fd::stdio(size_t buffer_size)
{
    return std::make_unique<posix_fd>(STDIN_FILENO, STDOUT_FILENO, false, buffer_size);
}

auto posix_fd::create_pipe_pair(size_t buffer_size)
        -> std::pair<std::unique_ptr<posix_fd>, std::unique_ptr<posix_fd>>
{
    int a_to_b[2], b_to_a[2];

    if (::pipe2(a_to_b, O_CLOEXEC) != 0)
        throw std::system_error{errno, std::generic_category(), "pipe2"};

    if (::pipe2(b_to_a, O_CLOEXEC) != 0) {
        auto ec = errno;
        ::close(a_to_b[0]), ::close(a_to_b[1]);
        throw std::system_error{ec, std::generic_category(), "pipe2"};
    }

    auto a = std::make_unique<posix_fd>(b_to_a[0], a_to_b[1], true, buffer_size);
    auto b = std::make_unique<posix_fd>(a_to_b[0], b_to_a[1], true, buffer_size);
    return std::make_pair(std::move(a), std::move(b));
}

bool posix_fd::readable() noexcept
{
    return _in._readable();
}

void posix_fd::close() noexcept
{
    bool const was_open = not _in._closed.exchange(true);
    _out._closed.store(true, std::memory_order_release);

    // Wakes up a reader blocked on a socket. Fails with ENOTSOCK for pipes and files.
    if (was_open) { ::shutdown(_in._fd, SHUT_RDWR); }
}

void posix_fd::get_total_rw(size_t* num_read, size_t* num_write)
{
    *num_read = _in._ntotal.load(std::memory_order_relaxed);
    *num_write = _out._ntotal.load(std::memory_order_relaxed);
}
}  // namespace mprpc::transport
