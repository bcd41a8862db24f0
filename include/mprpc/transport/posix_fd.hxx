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
#include <utility>
#include <vector>

#include "../transport.hxx"

namespace mprpc::transport {
/**
 * Transport over POSIX file descriptors: pipes, stdio, sockets, character devices.
 *
 * Either one duplex descriptor (socket) or a separate input/output pair (stdio, named pipes).
 *  Writes into a pipe whose read end is gone raise SIGPIPE, unless the application ignores it;
 *  sockets are written with MSG_NOSIGNAL.
 */
class posix_fd : public if_transport
{
    class fd_streambuf : public std::streambuf
    {
        friend class posix_fd;

        int _fd = -1;
        bool _is_socket = true;
        std::atomic_bool _closed = false;
        std::atomic_size_t _ntotal = 0;
        std::vector<char> _buf;

       public:
        fd_streambuf(int fd, size_t buffer_size);

       protected:
        int_type underflow() override;
        int_type overflow(int_type ch) override;
        int sync() override;

       private:
        bool _flush_all();
        bool _readable() noexcept;
    };

   private:
    fd_streambuf _in;
    fd_streambuf _out;
    bool _owns;

   public:
    /**
     * Duplex descriptor
     */
    posix_fd(int fd, bool owns, size_t buffer_size = 4096);

    /**
     * Separate input and output descriptors
     */
    posix_fd(int in_fd, int out_fd, bool owns, size_t buffer_size = 4096);

    ~posix_fd() override;

   public:
    /**
     * Process stdin/stdout. Descriptors are not owned.
     */
    static std::unique_ptr<posix_fd> stdio(size_t buffer_size = 4096);

    /**
     * Two endpoints connected by a pair of pipe(2)s.
     */
    static std::pair<std::unique_ptr<posix_fd>, std::unique_ptr<posix_fd>>
    create_pipe_pair(size_t buffer_size = 4096);

   public:
    bool readable() noexcept override;
    void close() noexcept override;
    void get_total_rw(size_t* num_read, size_t* num_write) override;

    int input_fd() const noexcept { return _in._fd; }
    int output_fd() const noexcept { return _out._fd; }
};
}  // namespace mprpc::transport
