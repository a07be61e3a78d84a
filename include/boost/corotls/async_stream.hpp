//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corosio
//

#ifndef BOOST_COROTLS_ASYNC_STREAM_HPP
#define BOOST_COROTLS_ASYNC_STREAM_HPP

#include <boost/corotls/detail/config.hpp>
#include <boost/capy/buffers.hpp>

#include <concepts>

namespace boost::corotls {

/** Concept for a transport carrying ciphertext.

    A transport provides `read_some` and `write_some` operations
    whose awaitables complete with `capy::io_result<std::size_t>`.
    End of stream is reported as an error comparing equal to
    `capy::cond::eof`.

    A transport may additionally provide:

    @li `shutdown()`, an awaitable completing with
        `capy::io_result<>`, which ends the send direction.

    @li `flush()`, an awaitable completing with
        `capy::io_result<>`, which pushes buffered bytes.

    @li `is_write_vectored() const`, returning `bool`.

    Streams skip whichever of these the transport lacks.

    @par Split Streams
    A transport used with @ref stream::split must tolerate one
    read and one write in flight at the same time, scheduled
    independently on the same thread.
*/
template<class T>
concept AsyncStream =
    std::movable<T> &&
    requires(T& t, capy::mutable_buffer mb, capy::const_buffer cb)
    {
        t.read_some(mb);
        t.write_some(cb);
    };

namespace detail {

template<class T>
concept has_shutdown = requires(T& t) { t.shutdown(); };

template<class T>
concept has_flush = requires(T& t) { t.flush(); };

template<class T>
concept has_write_vectored = requires(T const& t)
{
    { t.is_write_vectored() } -> std::convertible_to<bool>;
};

} // namespace detail

} // namespace boost::corotls

#endif
