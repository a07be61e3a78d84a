//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corosio
//

#ifndef BOOST_COROTLS_BUFFERING_HPP
#define BOOST_COROTLS_BUFFERING_HPP

#include <boost/corotls/detail/config.hpp>
#include <boost/corotls/detail/borrowed_buffer.hpp>
#include <boost/corotls/detail/copy_buffer.hpp>

namespace boost::corotls {

/** Buffering policy which copies ciphertext through private buffers.

    Each direction owns a 16 KiB buffer. Operations may be
    abandoned at any suspension point and started again.
    This is the default policy of @ref stream.
*/
struct copy_buffering
{
    using read_buffer = detail::copy_read_buffer;
    using write_buffer = detail::copy_write_buffer;

    /// Whether `write_io` ends by draining the write buffer.
    static constexpr bool drain_after_write = true;
};

/** Buffering policy performing transport I/O on engine memory.

    The transport reads into and writes from the regions the
    engine presents, so no ciphertext is copied. Each region is
    guarded by a lease from the engine; completing transport I/O
    after the lease expired is reported as a logic error.

    @par Preconditions
    An operation must never be abandoned while its transport
    operation is pending, because the transport would keep
    writing into memory the engine may reuse.
*/
struct borrowed_buffering
{
    using read_buffer = detail::borrowed_read_buffer;
    using write_buffer = detail::borrowed_write_buffer;
    static constexpr bool drain_after_write = false;
};

} // namespace boost::corotls

#endif
