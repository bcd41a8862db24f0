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
#include <algorithm>
#include <atomic>
#include <deque>
#include <utility>

#include "../thread/event_wait.hxx"
#include "../transport.hxx"

namespace mprpc::transport {
/**
 * In-process duplex pipe. create() returns two connected endpoints.
 */
class inmemory_pipe : public if_transport
{
    struct pipe {
        thread::event_wait lock;
        std::deque<char> strm;
        bool closed = false;
    };

    class streambuf : public std::streambuf
    {
        friend class inmemory_pipe;

        std::shared_ptr<pipe> _in, _out;

        char _ibuf[2048];
        char _obuf[2048];

        std::atomic_size_t _nread = 0;
        std::atomic_size_t _nwrite = 0;

       public:
        streambuf() { setp(_obuf, _obuf + sizeof _obuf); }

       protected:
        int_type overflow(int_type ch) override
        {
            if (not _do_sync())
                return traits_type::eof();

            if (not traits_type::eq_int_type(ch, traits_type::eof())) {
                *pptr() = traits_type::to_char_type(ch);
                pbump(1);
            }

            return traits_type::not_eof(ch);
        }

        int_type underflow() override
        {
            size_t nread = 0;

            _in->lock.wait([&] { return _in->closed || not _in->strm.empty(); });
            _in->lock.critical_section([&] {
                nread = std::min(sizeof _ibuf, _in->strm.size());
                std::copy_n(_in->strm.begin(), nread, _ibuf);
                _in->strm.erase(_in->strm.begin(), _in->strm.begin() + nread);
            });

            if (nread == 0)
                return traits_type::eof();

            _nread.fetch_add(nread, std::memory_order_relaxed);
            setg(_ibuf, _ibuf, _ibuf + nread);
            return traits_type::to_int_type(_ibuf[0]);
        }

        int sync() override
        {
            return _do_sync() ? 0 : -1;
        }

       private:
        bool _do_sync()
        {
            auto wbeg = pbase();
            auto nwrite = pptr() - wbeg;
            bool disconnected = false;

            if (nwrite > 0) {
                _out->lock.notify_all([&] {
                    if (_out->closed) {
                        disconnected = true;
                        return;
                    }

                    _out->strm.insert(_out->strm.end(), wbeg, wbeg + nwrite);
                });

                if (not disconnected)
                    _nwrite.fetch_add(size_t(nwrite), std::memory_order_relaxed);
            }

            setp(_obuf, _obuf + sizeof _obuf);
            return not disconnected;
        }

        bool _readable()
        {
            if (gptr() < egptr()) { return true; }
            return _in->lock.critical_section([&] { return _in->closed || not _in->strm.empty(); });
        }
    };

   private:
    streambuf _buf;

   private:
    explicit inmemory_pipe(std::string name)
            : if_transport(&_buf, &_buf, std::move(name))
    {
    }

   public:
    static auto create()
    {
        std::unique_ptr<inmemory_pipe> a{new inmemory_pipe{"inmemory:a"}};
        std::unique_ptr<inmemory_pipe> b{new inmemory_pipe{"inmemory:b"}};

        auto pa = std::make_shared<pipe>();
        auto pb = std::make_shared<pipe>();

        a->_buf._in = b->_buf._out = pa;
        a->_buf._out = b->_buf._in = pb;

        return std::make_pair(std::move(a), std::move(b));
    }

   public:
    ~inmemory_pipe() override
    {
        inmemory_pipe::close();
    }

    bool readable() noexcept override
    {
        return _buf._readable();
    }

    void close() noexcept override
    {
        _buf._in->lock.notify_all([&] { _buf._in->closed = true; });
        _buf._out->lock.notify_all([&] { _buf._out->closed = true; });
    }

    void get_total_rw(size_t* num_read, size_t* num_write) override
    {
        *num_read = _buf._nread.load(std::memory_order_relaxed);
        *num_write = _buf._nwrite.load(std::memory_order_relaxed);
    }
};
}  // namespace mprpc::transport
