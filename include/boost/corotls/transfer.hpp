//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corosio
//

#ifndef BOOST_COROTLS_TRANSFER_HPP
#define BOOST_COROTLS_TRANSFER_HPP

#include <boost/corotls/detail/config.hpp>
#include <boost/system/error_code.hpp>

#include <cstddef>

namespace boost::corotls {

/** The outcome of a synchronous data-moving call.

    Engines and buffering strategies exchange bytes through
    calls which never suspend. Each such call reports one of
    three outcomes:

    @li @ref kind::needs_io : nothing can move until an
        asynchronous transport operation completes.

    @li @ref kind::delivered : `bytes()` bytes moved. Zero
        delivered bytes on a read means end of input.

    @li @ref kind::failed : the operation failed with `error()`.

    Keeping "needs I/O" apart from failures means an empty
    buffer is never confused with a transport that would block.
*/
class transfer
{
public:
    enum class kind
    {
        needs_io,
        delivered,
        failed
    };

    static transfer
    needs_io() noexcept
    {
        return transfer(kind::needs_io, 0, {});
    }

    static transfer
    delivered(std::size_t n) noexcept
    {
        return transfer(kind::delivered, n, {});
    }

    static transfer
    failed(system::error_code ec) noexcept
    {
        return transfer(kind::failed, 0, ec);
    }

    kind
    state() const noexcept
    {
        return state_;
    }

    /// Return the number of bytes moved, zero unless delivered.
    std::size_t
    bytes() const noexcept
    {
        return n_;
    }

    /// Return the failure, empty unless failed.
    system::error_code
    error() const noexcept
    {
        return ec_;
    }

private:
    transfer(
        kind k,
        std::size_t n,
        system::error_code ec) noexcept
        : state_(k)
        , n_(n)
        , ec_(ec)
    {
    }

    kind state_;
    std::size_t n_;
    system::error_code ec_;
};

} // namespace boost::corotls

#endif
