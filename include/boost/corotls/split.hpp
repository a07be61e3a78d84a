//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corosio
//

#ifndef BOOST_COROTLS_SPLIT_HPP
#define BOOST_COROTLS_SPLIT_HPP

#include <boost/corotls/detail/config.hpp>
#include <boost/corotls/detail/except.hpp>
#include <boost/corotls/error.hpp>
#include <boost/corotls/stream.hpp>
#include <boost/assert/source_location.hpp>
#include <boost/capy/buffers.hpp>
#include <boost/capy/io_result.hpp>
#include <boost/capy/task.hpp>
#include <boost/system/errc.hpp>
#include <boost/system/result.hpp>

#include <cstddef>
#include <memory>
#include <span>
#include <utility>

namespace boost::corotls {

template<AsyncStream Transport, class Buffering>
struct reunite_error;

namespace detail {

template<class Stream>
struct split_state
{
    Stream s;
    bool reading = false;
    bool writing = false;

    explicit
    split_state(Stream&& other)
        : s(std::move(other))
    {
    }
};

// Marks one direction busy for the lifetime of an operation.
class direction_guard
{
    bool& busy_;

public:
    explicit
    direction_guard(bool& busy) noexcept
        : busy_(busy)
    {
        busy_ = true;
    }

    direction_guard(direction_guard const&) = delete;
    direction_guard& operator=(direction_guard const&) = delete;

    ~direction_guard()
    {
        busy_ = false;
    }
};

} // namespace detail

/** The reading half of a split @ref stream.

    Reads through this half never write to the transport. Alerts
    the engine produces while reading are sent by the next
    operation on the @ref write_half.

    A half which belongs to no stream, such as one default
    constructed or moved from, fails every operation with
    `errc::bad_file_descriptor`.

    @par Thread Safety
    Both halves must be used from the same thread. One read may
    be in flight concurrently with one operation on the write
    half; starting a second read while one is pending fails with
    @ref error::operation_in_progress.
*/
template<AsyncStream Transport, class Buffering>
class read_half
{
    template<AsyncStream, class> friend class stream;

    template<AsyncStream T, class B>
    friend system::result<stream<T, B>, reunite_error<T, B>>
    reunite(read_half<T, B>&&, write_half<T, B>&&);

    using stream_type = stream<Transport, Buffering>;
    using state_type = detail::split_state<stream_type>;

    std::shared_ptr<state_type> st_;

    explicit
    read_half(std::shared_ptr<state_type> st) noexcept
        : st_(std::move(st))
    {
    }

    static capy::task<capy::io_result<std::size_t>>
    do_read(std::shared_ptr<state_type> st, capy::mutable_buffer buf)
    {
        if(! st)
            co_return capy::io_result<std::size_t>{
                make_error_code(system::errc::bad_file_descriptor), 0};
        if(st->reading)
            co_return capy::io_result<std::size_t>{
                error::operation_in_progress, 0};
        detail::direction_guard g(st->reading);
        co_return co_await st->s.read_inner(buf, true);
    }

public:
    /// Construct a half which belongs to no stream.
    read_half() noexcept = default;

    read_half(read_half&&) noexcept = default;
    read_half& operator=(read_half&&) noexcept = default;

    /// Read decrypted data, see @ref stream::read.
    capy::task<capy::io_result<std::size_t>>
    read(capy::mutable_buffer buf)
    {
        return do_read(st_, buf);
    }

    /// Return whether both halves came from the same stream.
    bool
    is_pair_of(write_half<Transport, Buffering> const& w) const noexcept
    {
        return st_ && st_ == w.st_;
    }
};

/** The writing half of a split @ref stream.

    @par Thread Safety
    As for @ref read_half.
*/
template<AsyncStream Transport, class Buffering>
class write_half
{
    template<AsyncStream, class> friend class stream;
    template<AsyncStream, class> friend class read_half;

    template<AsyncStream T, class B>
    friend system::result<stream<T, B>, reunite_error<T, B>>
    reunite(read_half<T, B>&&, write_half<T, B>&&);

    using stream_type = stream<Transport, Buffering>;
    using state_type = detail::split_state<stream_type>;

    std::shared_ptr<state_type> st_;

    explicit
    write_half(std::shared_ptr<state_type> st) noexcept
        : st_(std::move(st))
    {
    }

    static capy::task<capy::io_result<std::size_t>>
    do_write(std::shared_ptr<state_type> st, capy::const_buffer buf)
    {
        if(! st)
            co_return capy::io_result<std::size_t>{
                make_error_code(system::errc::bad_file_descriptor), 0};
        if(st->writing)
            co_return capy::io_result<std::size_t>{
                error::operation_in_progress, 0};
        detail::direction_guard g(st->writing);
        co_return co_await st->s.write_inner(buf);
    }

    static capy::task<capy::io_result<>>
    do_flush(std::shared_ptr<state_type> st)
    {
        if(! st)
            co_return capy::io_result<>{
                make_error_code(system::errc::bad_file_descriptor)};
        if(st->writing)
            co_return capy::io_result<>{error::operation_in_progress};
        detail::direction_guard g(st->writing);
        co_return co_await st->s.flush();
    }

    static capy::task<capy::io_result<>>
    do_shutdown(std::shared_ptr<state_type> st)
    {
        if(! st)
            co_return capy::io_result<>{
                make_error_code(system::errc::bad_file_descriptor)};
        if(st->writing)
            co_return capy::io_result<>{error::operation_in_progress};
        detail::direction_guard g(st->writing);
        co_return co_await st->s.shutdown();
    }

public:
    /// Construct a half which belongs to no stream.
    write_half() noexcept = default;

    write_half(write_half&&) noexcept = default;
    write_half& operator=(write_half&&) noexcept = default;

    /// Write data, see @ref stream::write.
    capy::task<capy::io_result<std::size_t>>
    write(capy::const_buffer buf)
    {
        return do_write(st_, buf);
    }

    /// Write the first non-empty buffer of a sequence.
    capy::task<capy::io_result<std::size_t>>
    write_vectored(std::span<capy::const_buffer const> bufs)
    {
        return do_write(st_, stream_type::first_non_empty(bufs));
    }

    /// Send everything the engine holds, then flush the transport.
    capy::task<capy::io_result<>>
    flush()
    {
        return do_flush(st_);
    }

    /// Send close_notify, then shut down the transport.
    capy::task<capy::io_result<>>
    shutdown()
    {
        return do_shutdown(st_);
    }

    bool
    is_write_vectored() const noexcept
    {
        return st_ && st_->s.is_write_vectored();
    }
};

/** The halves returned by a failed @ref reunite.

    The halves are handed back unchanged and stay usable.
*/
template<AsyncStream Transport, class Buffering>
struct reunite_error
{
    read_half<Transport, Buffering> read;
    write_half<Transport, Buffering> write;
};

template<AsyncStream Transport, class Buffering>
BOOST_NORETURN
void
throw_exception_from_error(
    reunite_error<Transport, Buffering> const&,
    source_location const& loc)
{
    detail::throw_system_error(
        make_error_code(error::reunite_mismatch), loc);
}

/** Rejoin the halves of a split stream.

    @return The original stream, or both halves unchanged
        inside a @ref reunite_error when they did not come
        from the same call to @ref stream::split.

    @throws std::logic_error if an operation is in flight on
        either half.
*/
template<AsyncStream Transport, class Buffering>
system::result<
    stream<Transport, Buffering>,
    reunite_error<Transport, Buffering>>
reunite(
    read_half<Transport, Buffering>&& r,
    write_half<Transport, Buffering>&& w)
{
    using error_type = reunite_error<Transport, Buffering>;
    using result_type = system::result<
        stream<Transport, Buffering>, error_type>;

    if(! r.is_pair_of(w))
        return result_type(
            system::in_place_error,
            error_type{std::move(r), std::move(w)});

    if(r.st_->reading || r.st_->writing)
        detail::throw_logic_error(
            "reunite called with an operation in flight");

    auto st = std::move(r.st_);
    w.st_.reset();
    return result_type(
        system::in_place_value,
        std::move(st->s));
}

template<AsyncStream Transport, class Buffering>
auto
stream<Transport, Buffering>::
split() && -> std::pair<
    read_half<Transport, Buffering>,
    write_half<Transport, Buffering>>
{
    auto st = std::make_shared<
        detail::split_state<stream>>(std::move(*this));
    return {
        read_half<Transport, Buffering>(st),
        write_half<Transport, Buffering>(st)};
}

} // namespace boost::corotls

#endif
