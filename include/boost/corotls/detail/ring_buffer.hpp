//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corosio
//

#ifndef BOOST_COROTLS_DETAIL_RING_BUFFER_HPP
#define BOOST_COROTLS_DETAIL_RING_BUFFER_HPP

#include <boost/corotls/detail/config.hpp>
#include <boost/corotls/detail/except.hpp>
#include <boost/capy/buffers.hpp>

#include <cstddef>
#include <memory>

namespace boost::corotls::detail {

/** A fixed-capacity byte region with read and write cursors.

    Bytes are appended at the write cursor and consumed at the
    read cursor. The region never wraps or grows; once every
    byte has been consumed both cursors return to zero so the
    whole capacity is available again.

    @par Invariants
    `read_offset() <= write_offset() <= capacity()`
*/
class ring_buffer
{
    std::unique_ptr<char[]> data_;
    std::size_t capacity_;
    std::size_t read_ = 0;
    std::size_t write_ = 0;

public:
    static constexpr std::size_t default_capacity = 16384;

    explicit
    ring_buffer(std::size_t capacity = default_capacity)
        : data_(new char[capacity])
        , capacity_(capacity)
    {
    }

    ring_buffer(ring_buffer&&) noexcept = default;
    ring_buffer& operator=(ring_buffer&&) noexcept = default;

    /// Return the number of readable bytes.
    std::size_t
    size() const noexcept
    {
        return write_ - read_;
    }

    bool
    empty() const noexcept
    {
        return read_ == write_;
    }

    /// Return the number of bytes which may still be appended.
    std::size_t
    available() const noexcept
    {
        return capacity_ - write_;
    }

    bool
    full() const noexcept
    {
        return write_ == capacity_;
    }

    std::size_t
    capacity() const noexcept
    {
        return capacity_;
    }

    std::size_t
    read_offset() const noexcept
    {
        return read_;
    }

    std::size_t
    write_offset() const noexcept
    {
        return write_;
    }

    /// Return the readable bytes.
    capy::const_buffer
    data() const noexcept
    {
        return capy::const_buffer(data_.get() + read_, size());
    }

    /// Return the free tail.
    capy::mutable_buffer
    prepare() noexcept
    {
        return capy::mutable_buffer(data_.get() + write_, available());
    }

    /** Make `n` bytes of the free tail readable.

        @throws std::logic_error if `n > available()`.
    */
    void
    commit(std::size_t n)
    {
        if(n > available())
            throw_logic_error("ring_buffer::commit: n > available()");
        write_ += n;
    }

    /** Consume `n` readable bytes.

        @throws std::logic_error if `n > size()`.
    */
    void
    advance(std::size_t n)
    {
        if(n > size())
            throw_logic_error("ring_buffer::advance: n > size()");
        read_ += n;
        if(read_ == write_)
        {
            read_ = 0;
            write_ = 0;
        }
    }
};

} // namespace boost::corotls::detail

#endif
