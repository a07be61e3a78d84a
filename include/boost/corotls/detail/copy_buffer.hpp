//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corosio
//

#ifndef BOOST_COROTLS_DETAIL_COPY_BUFFER_HPP
#define BOOST_COROTLS_DETAIL_COPY_BUFFER_HPP

#include <boost/corotls/detail/config.hpp>
#include <boost/corotls/detail/ring_buffer.hpp>
#include <boost/corotls/async_stream.hpp>
#include <boost/corotls/error.hpp>
#include <boost/corotls/tls/engine.hpp>
#include <boost/capy/cond.hpp>
#include <boost/capy/io_result.hpp>
#include <boost/capy/task.hpp>

#include <algorithm>
#include <cstring>
#include <utility>

namespace boost::corotls::detail {

/** Read side of the copying strategy.

    Transport reads land in a private ring buffer; the engine
    copies out of it. The outcome of the last transport read
    which produced no bytes is latched and reported to exactly
    one later call of @ref read.

    Dropping a pending @ref fill leaves the buffer consistent,
    so the operation may simply be started again.
*/
class copy_read_buffer : public tls::ciphertext_source
{
public:
    enum class status
    {
        ok,
        eof,
        error
    };

    transfer
    read(
        capy::mutable_buffer dest,
        tls::region_owner const&) override
    {
        if(! buf_.empty())
        {
            auto const n = (std::min)(buf_.size(), dest.size());
            std::memcpy(dest.data(), buf_.data().data(), n);
            buf_.advance(n);
            return transfer::delivered(n);
        }

        switch(status_)
        {
        case status::eof:
            status_ = status::ok;
            return transfer::delivered(0);

        case status::error:
            status_ = status::ok;
            return transfer::failed(std::exchange(ec_, {}));

        case status::ok:
            break;
        }
        return transfer::needs_io();
    }

    /** Read once from the transport into the buffer.

        Returns immediately when the buffer already holds
        bytes. End of stream is latched and reported as zero
        bytes; other errors are latched and returned.
    */
    template<AsyncStream Stream>
    capy::task<capy::io_result<std::size_t>>
    fill(Stream& io)
    {
        if(! buf_.empty())
            co_return capy::io_result<std::size_t>{{}, buf_.size()};

        auto [ec, n] = co_await io.read_some(buf_.prepare());
        buf_.commit(n);
        if(ec)
        {
            if(ec == capy::cond::eof)
            {
                status_ = status::eof;
                co_return capy::io_result<std::size_t>{{}, n};
            }
            status_ = status::error;
            ec_ = ec;
            co_return capy::io_result<std::size_t>{ec, n};
        }
        status_ = n == 0 ? status::eof : status::ok;
        co_return capy::io_result<std::size_t>{{}, n};
    }

    status
    latched() const noexcept
    {
        return status_;
    }

    ring_buffer const&
    buffer() const noexcept
    {
        return buf_;
    }

private:
    ring_buffer buf_;
    status status_ = status::ok;
    system::error_code ec_;
};

//------------------------------------------------------------------------------

/** Write side of the copying strategy.

    The engine copies ciphertext into a private ring buffer
    and @ref drain writes all of it to the transport. A failed
    drain is latched and reported to exactly one later call
    of @ref write, unless a later transport write succeeds
    first.
*/
class copy_write_buffer : public tls::ciphertext_sink
{
public:
    transfer
    write(
        capy::const_buffer src,
        tls::region_owner const&) override
    {
        if(failed_)
        {
            failed_ = false;
            return transfer::failed(std::exchange(ec_, {}));
        }
        if(buf_.full())
            return transfer::needs_io();

        auto const n = (std::min)(src.size(), buf_.available());
        std::memcpy(buf_.prepare().data(), src.data(), n);
        buf_.commit(n);
        return transfer::delivered(n);
    }

    /** Write every buffered byte to the transport.

        Bytes are consumed as each transport write completes,
        so a failure keeps the unwritten remainder.

        @return The number of bytes written.
    */
    template<AsyncStream Stream>
    capy::task<capy::io_result<std::size_t>>
    drain(Stream& io)
    {
        std::size_t total = 0;
        while(! buf_.empty())
        {
            auto [ec, n] = co_await io.write_some(buf_.data());
            if(! ec && n == 0)
                ec = error::write_zero;
            if(ec)
            {
                failed_ = true;
                ec_ = ec;
                co_return capy::io_result<std::size_t>{ec, total};
            }
            buf_.advance(n);
            total += n;
            failed_ = false;
            ec_ = {};
        }
        co_return capy::io_result<std::size_t>{{}, total};
    }

    ring_buffer const&
    buffer() const noexcept
    {
        return buf_;
    }

    bool
    has_failed() const noexcept
    {
        return failed_;
    }

private:
    ring_buffer buf_;
    bool failed_ = false;
    system::error_code ec_;
};

} // namespace boost::corotls::detail

#endif
