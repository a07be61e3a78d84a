//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corosio
//

#ifndef BOOST_COROTLS_STREAM_HPP
#define BOOST_COROTLS_STREAM_HPP

#include <boost/corotls/detail/config.hpp>
#include <boost/corotls/async_stream.hpp>
#include <boost/corotls/buffering.hpp>
#include <boost/corotls/error.hpp>
#include <boost/corotls/transfer.hpp>
#include <boost/corotls/tls/engine.hpp>
#include <boost/capy/buffers.hpp>
#include <boost/capy/error.hpp>
#include <boost/capy/io_result.hpp>
#include <boost/capy/task.hpp>
#include <boost/core/ignore_unused.hpp>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <span>
#include <utility>

namespace boost::corotls {

template<AsyncStream Transport, class Buffering>
class read_half;

template<AsyncStream Transport, class Buffering>
class write_half;

/** A TLS session layered over an asynchronous transport.

    The stream owns a transport and a @ref tls::engine, and
    moves bytes between them: ciphertext read from the transport
    is fed to the engine and decrypted, plaintext written by the
    caller is encrypted and sent. All protocol work is synchronous
    and only transport operations suspend.

    The @ref Buffering policy chooses how ciphertext crosses
    between engine and transport. @ref copy_buffering is the
    default; @ref borrowed_buffering avoids the copy but forbids
    abandoning an operation while its transport I/O is pending.

    @par Errors
    @li Transport errors are returned unchanged.
    @li Engine diagnostics compare equal to
        @ref condition::invalid_data.
    @li A transport ending in the middle of a record yields
        `capy::error::stream_truncated`, and one ending during
        the handshake yields @ref error::handshake_eof; both
        compare equal to @ref condition::unexpected_eof.
    @li A close_notify from the peer makes @ref read return
        `capy::error::eof`.

    @par Thread Safety
    Distinct objects: Safe.@n
    Shared objects: Unsafe. At most one read and one write may
    be in flight, and only through @ref split.

    @tparam Transport The transport type, see @ref AsyncStream.
    @tparam Buffering The buffering policy.
*/
template<AsyncStream Transport, class Buffering = copy_buffering>
class stream
{
    template<AsyncStream, class> friend class read_half;
    template<AsyncStream, class> friend class write_half;

    using io_size = capy::io_result<std::size_t>;

    Transport io_;
    std::unique_ptr<tls::engine> engine_;
    typename Buffering::read_buffer r_buf_;
    typename Buffering::write_buffer w_buf_;

    // Plaintext accepted by the engine whose
    // ciphertext has not been fully written yet.
    std::size_t pending_ = 0;

public:
    using transport_type = Transport;
    using buffering_type = Buffering;

    /// Byte counts exchanged during the handshake.
    struct handshake_info
    {
        std::size_t bytes_read = 0;
        std::size_t bytes_written = 0;
    };

    /** Construct a stream.

        No I/O is performed; call @ref handshake to establish
        the session.

        @param io The transport, moved into the stream.
        @param engine The session to drive. Must not be null.
    */
    stream(
        Transport io,
        std::unique_ptr<tls::engine> engine)
        : io_(std::move(io))
        , engine_(std::move(engine))
    {
    }

    stream(stream&&) = default;
    stream& operator=(stream&&) = default;

    Transport&
    next_layer() noexcept
    {
        return io_;
    }

    Transport const&
    next_layer() const noexcept
    {
        return io_;
    }

    tls::engine&
    engine() noexcept
    {
        return *engine_;
    }

    tls::engine const&
    engine() const noexcept
    {
        return *engine_;
    }

    /** Perform the TLS handshake.

        Alternates between sending and receiving handshake
        records until the engine completes, then sends any
        records it still holds.

        @return The bytes of ciphertext read and written.
    */
    capy::task<capy::io_result<handshake_info>>
    handshake();

    /** Read decrypted data.

        Completes as soon as at least one byte is available. An
        empty buffer completes immediately with zero bytes. If
        the handshake has not completed it is performed first.

        @param buf The buffer to fill.

        @return The number of bytes read.
    */
    capy::task<io_size>
    read(capy::mutable_buffer buf);

    /** Write data.

        The engine encrypts as much of `buf` as it accepts and
        the resulting ciphertext is written to the transport
        before the operation completes.

        If writing the ciphertext fails, the accepted bytes stay
        with the engine. The next call must present the same
        data; it completes the pending ciphertext and reports
        those bytes without encrypting them again.

        @param buf The data to write.

        @return The number of bytes accepted.
    */
    capy::task<io_size>
    write(capy::const_buffer buf);

    /** Write the first non-empty buffer of a sequence.

        @return The number of bytes accepted.
    */
    capy::task<io_size>
    write_vectored(std::span<capy::const_buffer const> bufs)
    {
        return write(first_non_empty(bufs));
    }

    /// Return whether the transport supports vectored writes.
    bool
    is_write_vectored() const noexcept
    {
        if constexpr(detail::has_write_vectored<Transport>)
            return io_.is_write_vectored();
        else
            return false;
    }

    /** Send everything the engine holds, then flush the transport.
    */
    capy::task<capy::io_result<>>
    flush();

    /** Send close_notify, then shut down the transport.

        The receive direction is unaffected; the peer's
        close_notify can still be read.
    */
    capy::task<capy::io_result<>>
    shutdown();

    /** Separate the stream into independently driven halves.

        @see reunite
    */
    std::pair<
        read_half<Transport, Buffering>,
        write_half<Transport, Buffering>>
    split() &&;

    /** Release the transport and the engine.

        Ciphertext buffered by the stream which the engine has
        not consumed yet is discarded.
    */
    std::pair<Transport, std::unique_ptr<tls::engine>>
    into_parts() &&
    {
        return {std::move(io_), std::move(engine_)};
    }

private:
    static capy::const_buffer
    first_non_empty(std::span<capy::const_buffer const> bufs) noexcept
    {
        for(auto const& b : bufs)
            if(b.size() != 0)
                return b;
        return {};
    }

    capy::task<io_size> read_io(bool split);
    capy::task<io_size> write_io();
    capy::task<io_size> read_inner(capy::mutable_buffer buf, bool split);
    capy::task<io_size> write_inner(capy::const_buffer buf);
    capy::task<capy::io_result<>> send_pending();
    capy::task<io_size> drain_residual();
};

//------------------------------------------------------------------------------

template<AsyncStream Transport, class Buffering>
auto
stream<Transport, Buffering>::
read_io(bool split) -> capy::task<io_size>
{
    std::size_t n;
    for(;;)
    {
        auto t = engine_->read_tls(r_buf_);
        if(t.state() == transfer::kind::delivered)
        {
            n = t.bytes();
            break;
        }
        if(t.state() == transfer::kind::failed)
            co_return io_size{t.error(), 0};

        auto [ec, filled] = co_await r_buf_.fill(io_);
        ignore_unused(filled);
        if(ec)
            co_return io_size{ec, 0};
    }

    auto ec = engine_->process_new_packets();
    if(ec)
    {
        // A split read half must not touch the write side.
        if(! split)
        {
            auto [alert_ec, alert_n] = co_await write_io();
            ignore_unused(alert_ec, alert_n);
        }
        co_return io_size{ec, 0};
    }

    if(engine_->peer_has_closed() && engine_->is_handshaking())
        co_return io_size{error::handshake_alert, 0};

    co_return io_size{{}, n};
}

template<AsyncStream Transport, class Buffering>
auto
stream<Transport, Buffering>::
write_io() -> capy::task<io_size>
{
    std::size_t n;
    for(;;)
    {
        auto t = engine_->write_tls(w_buf_);
        if(t.state() == transfer::kind::delivered)
        {
            n = t.bytes();
            break;
        }
        if(t.state() == transfer::kind::failed)
            co_return io_size{t.error(), 0};

        auto [ec, drained] = co_await w_buf_.drain(io_);
        ignore_unused(drained);
        if(ec)
            co_return io_size{ec, 0};
    }

    if constexpr(Buffering::drain_after_write)
    {
        auto [ec, drained] = co_await w_buf_.drain(io_);
        ignore_unused(drained);
        if(ec)
            co_return io_size{ec, n};
    }
    co_return io_size{{}, n};
}

template<AsyncStream Transport, class Buffering>
auto
stream<Transport, Buffering>::
handshake() -> capy::task<capy::io_result<handshake_info>>
{
    using result_type = capy::io_result<handshake_info>;

    handshake_info info;
    bool eof = false;

    for(;;)
    {
        while(engine_->wants_write() && engine_->is_handshaking())
        {
            auto [ec, n] = co_await write_io();
            if(ec)
                co_return result_type{ec, info};
            if(n == 0)
                co_return result_type{error::write_zero, info};
            info.bytes_written += n;
        }

        while(! eof && engine_->wants_read() && engine_->is_handshaking())
        {
            auto [ec, n] = co_await read_io(false);
            if(ec)
                co_return result_type{ec, info};
            info.bytes_read += n;
            if(n == 0)
                eof = true;
        }

        if(! engine_->is_handshaking())
            break;
        if(eof)
            co_return result_type{error::handshake_eof, info};
    }

    while(engine_->wants_write())
    {
        auto [ec, n] = co_await write_io();
        if(ec)
            co_return result_type{ec, info};
        if(n == 0)
            break;
        info.bytes_written += n;
    }

    co_return result_type{{}, info};
}

template<AsyncStream Transport, class Buffering>
auto
stream<Transport, Buffering>::
read_inner(
    capy::mutable_buffer buf,
    bool split) -> capy::task<io_size>
{
    if(buf.size() == 0)
        co_return io_size{{}, 0};

    for(;;)
    {
        auto t = engine_->read_plaintext(buf);
        switch(t.state())
        {
        case transfer::kind::delivered:
            if(t.bytes() == 0)
                co_return io_size{capy::error::eof, 0};
            co_return io_size{{}, t.bytes()};

        case transfer::kind::failed:
            co_return io_size{t.error(), 0};

        case transfer::kind::needs_io:
            break;
        }

        auto [ec, n] = co_await read_io(split);
        if(ec)
            co_return io_size{ec, 0};
        if(n == 0)
            co_return io_size{capy::error::stream_truncated, 0};
    }
}

template<AsyncStream Transport, class Buffering>
auto
stream<Transport, Buffering>::
write_inner(capy::const_buffer buf) -> capy::task<io_size>
{
    std::size_t accepted = 0;
    if(pending_ != 0)
    {
        // the same bytes again, after a failed drain
        accepted = (std::min)(pending_, buf.size());
        auto [ec, n] = co_await drain_residual();
        ignore_unused(n);
        if(ec)
            co_return io_size{ec, 0};
    }
    else
    {
        for(;;)
        {
            auto t = engine_->write_plaintext(buf);
            if(t.state() == transfer::kind::failed)
                co_return io_size{t.error(), 0};
            if(t.state() == transfer::kind::delivered)
            {
                accepted = t.bytes();
                break;
            }

            // The engine is full of ciphertext; make room.
            if(! engine_->wants_write())
                break;
            auto [ec, n] = co_await write_io();
            if(ec)
                co_return io_size{ec, 0};
            if(n == 0)
                break;
        }
        pending_ = accepted;
    }

    while(engine_->wants_write())
    {
        auto [ec, n] = co_await write_io();
        if(ec)
            co_return io_size{ec, 0};
        if(n == 0)
            break;
    }

    pending_ = 0;
    co_return io_size{{}, accepted};
}

template<AsyncStream Transport, class Buffering>
auto
stream<Transport, Buffering>::
read(capy::mutable_buffer buf) -> capy::task<io_size>
{
    if(engine_->is_handshaking())
    {
        auto [ec, info] = co_await handshake();
        ignore_unused(info);
        if(ec)
            co_return io_size{ec, 0};
    }
    co_return co_await read_inner(buf, false);
}

template<AsyncStream Transport, class Buffering>
auto
stream<Transport, Buffering>::
write(capy::const_buffer buf) -> capy::task<io_size>
{
    if(engine_->is_handshaking())
    {
        auto [ec, info] = co_await handshake();
        ignore_unused(info);
        if(ec)
            co_return io_size{ec, 0};
    }
    co_return co_await write_inner(buf);
}

template<AsyncStream Transport, class Buffering>
auto
stream<Transport, Buffering>::
send_pending() -> capy::task<capy::io_result<>>
{
    {
        auto [ec, n] = co_await drain_residual();
        ignore_unused(n);
        if(ec)
            co_return capy::io_result<>{ec};
    }
    while(engine_->wants_write())
    {
        auto [ec, n] = co_await write_io();
        if(ec)
            co_return capy::io_result<>{ec};
        if(n == 0)
            co_return capy::io_result<>{error::write_zero};
    }

    // The accepted bytes reached the transport; a later
    // write carries new plaintext.
    pending_ = 0;
    co_return capy::io_result<>{};
}

// Ciphertext left behind by a failed drain is
// held by the write buffer, not the engine.
template<AsyncStream Transport, class Buffering>
auto
stream<Transport, Buffering>::
drain_residual() -> capy::task<io_size>
{
    if constexpr(Buffering::drain_after_write)
        co_return co_await w_buf_.drain(io_);
    else
        co_return io_size{{}, 0};
}

template<AsyncStream Transport, class Buffering>
auto
stream<Transport, Buffering>::
flush() -> capy::task<capy::io_result<>>
{
    auto ec = engine_->flush_plaintext();
    if(ec)
        co_return capy::io_result<>{ec};

    {
        auto [sent_ec] = co_await send_pending();
        if(sent_ec)
            co_return capy::io_result<>{sent_ec};
    }

    if constexpr(detail::has_flush<Transport>)
    {
        auto [flush_ec] = co_await io_.flush();
        if(flush_ec)
            co_return capy::io_result<>{flush_ec};
    }
    co_return capy::io_result<>{};
}

template<AsyncStream Transport, class Buffering>
auto
stream<Transport, Buffering>::
shutdown() -> capy::task<capy::io_result<>>
{
    auto ec = engine_->send_close_notify();
    if(ec)
        co_return capy::io_result<>{ec};

    {
        auto [sent_ec] = co_await send_pending();
        if(sent_ec)
            co_return capy::io_result<>{sent_ec};
    }

    if constexpr(detail::has_shutdown<Transport>)
    {
        auto [shut_ec] = co_await io_.shutdown();
        if(shut_ec)
            co_return capy::io_result<>{shut_ec};
    }
    co_return capy::io_result<>{};
}

} // namespace boost::corotls

#include <boost/corotls/split.hpp>

#endif
