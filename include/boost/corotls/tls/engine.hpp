//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corosio
//

#ifndef BOOST_COROTLS_TLS_ENGINE_HPP
#define BOOST_COROTLS_TLS_ENGINE_HPP

#include <boost/corotls/detail/config.hpp>
#include <boost/corotls/tls/context.hpp>
#include <boost/corotls/transfer.hpp>
#include <boost/capy/buffers.hpp>
#include <boost/system/error_code.hpp>

#include <array>
#include <functional>
#include <memory>
#include <span>

namespace boost::corotls::tls {

/** A lease on the memory behind a region handed to a strategy.

    The region stays valid for as long as the lease has not
    expired. Strategies which keep a region across a suspension
    hold the lease and check it when the transport completes.
*/
using region_owner = std::weak_ptr<void const>;

/// A 32 byte TLS session identifier.
using session_id = std::array<unsigned char, 32>;

/** A function producing the session identifier of a ClientHello.

    Receives the identifier the engine would otherwise send
    and returns the one to send instead.
*/
using session_id_generator =
    std::function<session_id(std::span<unsigned char const>)>;

/** Synchronous source of received ciphertext.

    Implemented by the read buffering strategies.
*/
class ciphertext_source
{
public:
    virtual ~ciphertext_source() = default;

    /** Copy received ciphertext into `dest`.

        @param dest The region to fill.
        @param owner The lease on `dest`.

        @return The number of bytes placed in `dest`, zero at
            end of input, or `needs_io` when nothing has been
            received yet.
    */
    virtual transfer
    read(
        capy::mutable_buffer dest,
        region_owner const& owner) = 0;
};

/** Synchronous sink for outgoing ciphertext.

    Implemented by the write buffering strategies.
*/
class ciphertext_sink
{
public:
    virtual ~ciphertext_sink() = default;

    /** Take ciphertext from `src`.

        @param src The bytes to send.
        @param owner The lease on `src`.

        @return The number of bytes taken from `src`, or
            `needs_io` when the transport must drain first.
    */
    virtual transfer
    write(
        capy::const_buffer src,
        region_owner const& owner) = 0;
};

/** A synchronous TLS session.

    An engine holds the protocol state of one TLS connection. It
    never performs I/O: ciphertext enters through @ref read_tls
    and leaves through @ref write_tls, while plaintext is
    exchanged with @ref read_plaintext and @ref write_plaintext.

    Regions an engine passes to a source or sink remain valid
    until the engine is destroyed or the same call is repeated;
    @ref owner returns the lease on them.

    @par Thread Safety
    Distinct objects: Safe.@n
    Shared objects: Unsafe.
*/
class BOOST_COROTLS_DECL engine
{
public:
    virtual ~engine() = default;

    engine(engine const&) = delete;
    engine& operator=(engine const&) = delete;

    /// Pull ciphertext from `src` into the engine.
    virtual transfer read_tls(ciphertext_source& src) = 0;

    /** Process ciphertext received by @ref read_tls.

        Advances the handshake and decrypts records.

        @return An error if the peer violated the protocol.
    */
    virtual system::error_code process_new_packets() = 0;

    /** Copy decrypted plaintext into `dest`.

        @return The bytes copied; zero once the peer sent
            close_notify; `needs_io` when more ciphertext must
            be processed first.
    */
    virtual transfer read_plaintext(capy::mutable_buffer dest) = 0;

    /// Encrypt plaintext from `src`, returning the bytes accepted.
    virtual transfer write_plaintext(capy::const_buffer src) = 0;

    /// Encrypt any plaintext still held by the engine.
    virtual system::error_code flush_plaintext() = 0;

    /// Push produced ciphertext into `sink`.
    virtual transfer write_tls(ciphertext_sink& sink) = 0;

    virtual bool wants_read() const noexcept = 0;
    virtual bool wants_write() const noexcept = 0;
    virtual bool is_handshaking() const noexcept = 0;
    virtual bool peer_has_closed() const noexcept = 0;

    /// Queue a close_notify alert for sending.
    virtual system::error_code send_close_notify() = 0;

    virtual role get_role() const noexcept = 0;

protected:
    engine()
        : lease_(std::make_shared<char>())
    {
    }

    /// Return the lease on regions handed out by this engine.
    region_owner
    owner() const noexcept
    {
        return lease_;
    }

private:
    std::shared_ptr<void const> lease_;
};

} // namespace boost::corotls::tls

#endif
