//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corosio
//

#ifndef BOOST_COROTLS_DETAIL_BORROWED_BUFFER_HPP
#define BOOST_COROTLS_DETAIL_BORROWED_BUFFER_HPP

#include <boost/corotls/detail/config.hpp>
#include <boost/corotls/detail/except.hpp>
#include <boost/corotls/async_stream.hpp>
#include <boost/corotls/error.hpp>
#include <boost/corotls/tls/engine.hpp>
#include <boost/capy/cond.hpp>
#include <boost/capy/io_result.hpp>
#include <boost/capy/task.hpp>

#include <cstddef>

namespace boost::corotls::detail {

/** Progress of one borrowed-region cycle.

    A cycle starts when the engine presents a region, which is
    recorded. The transport operation then runs directly against
    that region and its byte count is stored until the engine
    presents the same region again and collects it.
*/
enum class borrow_state
{
    waiting_for_caller,
    waiting_for_transport,
    filled
};

/** Common bookkeeping for the borrowed strategies.

    @tparam Buffer `capy::mutable_buffer` or `capy::const_buffer`.
*/
template<class Buffer>
class borrowed_region
{
public:
    borrow_state
    state() const noexcept
    {
        return state_;
    }

    /// Return the recorded region, empty when none is recorded.
    Buffer
    region() const noexcept
    {
        return region_;
    }

protected:
    // Called from the synchronous side.
    transfer
    exchange(
        Buffer b,
        tls::region_owner const& owner)
    {
        if(state_ != borrow_state::filled)
        {
            region_ = b;
            owner_ = owner;
            state_ = borrow_state::waiting_for_transport;
            return transfer::needs_io();
        }

        if(b.data() != region_.data() || b.size() < filled_)
            return transfer::failed(error::region_mismatch);

        // Zero bytes means end of stream; it stays
        // reported until the stream is discarded.
        if(filled_ != 0)
        {
            state_ = borrow_state::waiting_for_caller;
            region_ = Buffer();
            owner_.reset();
        }
        return transfer::delivered(filled_);
    }

    // Returns true when the transport may run.
    bool
    before_io(system::error_code& ec)
    {
        switch(state_)
        {
        case borrow_state::filled:
            return false;

        case borrow_state::waiting_for_caller:
            ec = error::region_not_recorded;
            return false;

        case borrow_state::waiting_for_transport:
            break;
        }
        if(owner_.expired())
        {
            state_ = borrow_state::waiting_for_caller;
            region_ = Buffer();
            ec = error::region_expired;
            return false;
        }
        return true;
    }

    void
    after_io(std::size_t n)
    {
        if(owner_.expired())
            throw_logic_error(
                "borrowed region released during transport I/O");
        filled_ = n;
        state_ = borrow_state::filled;
    }

    Buffer region_;
    tls::region_owner owner_;
    std::size_t filled_ = 0;
    borrow_state state_ = borrow_state::waiting_for_caller;
};

//------------------------------------------------------------------------------

/** Read side of the borrowed strategy.

    The transport reads straight into the region the engine
    presented, avoiding the copy through a private buffer.

    @par Preconditions
    The region must stay valid and unmoved from the call to
    @ref read which records it until the matching @ref fill
    completes, including when that fill is abandoned.
*/
class borrowed_read_buffer
    : public tls::ciphertext_source
    , public borrowed_region<capy::mutable_buffer>
{
public:
    transfer
    read(
        capy::mutable_buffer dest,
        tls::region_owner const& owner) override
    {
        return exchange(dest, owner);
    }

    /** Perform one transport read into the recorded region.

        End of stream is stored as zero bytes. On other errors
        the region stays recorded so the read may be retried.
    */
    template<AsyncStream Stream>
    capy::task<capy::io_result<std::size_t>>
    fill(Stream& io)
    {
        system::error_code ec;
        if(! before_io(ec))
            co_return capy::io_result<std::size_t>{ec, ec ? 0 : filled_};

        auto [ec2, n] = co_await io.read_some(region_);
        if(ec2 && ec2 != capy::cond::eof)
            co_return capy::io_result<std::size_t>{ec2, 0};
        after_io(n);
        co_return capy::io_result<std::size_t>{{}, n};
    }
};

/** Write side of the borrowed strategy.

    The transport writes straight from the region the engine
    presented. No bytes are buffered between writes.

    @par Preconditions
    As for @ref borrowed_read_buffer.
*/
class borrowed_write_buffer
    : public tls::ciphertext_sink
    , public borrowed_region<capy::const_buffer>
{
public:
    transfer
    write(
        capy::const_buffer src,
        tls::region_owner const& owner) override
    {
        return exchange(src, owner);
    }

    /// Perform one transport write from the recorded region.
    template<AsyncStream Stream>
    capy::task<capy::io_result<std::size_t>>
    drain(Stream& io)
    {
        system::error_code ec;
        if(! before_io(ec))
            co_return capy::io_result<std::size_t>{ec, ec ? 0 : filled_};

        auto [ec2, n] = co_await io.write_some(region_);
        if(ec2)
            co_return capy::io_result<std::size_t>{ec2, 0};
        after_io(n);
        co_return capy::io_result<std::size_t>{{}, n};
    }
};

} // namespace boost::corotls::detail

#endif
