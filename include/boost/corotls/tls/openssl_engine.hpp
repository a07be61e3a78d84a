//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corosio
//

#ifndef BOOST_COROTLS_TLS_OPENSSL_ENGINE_HPP
#define BOOST_COROTLS_TLS_OPENSSL_ENGINE_HPP

#include <boost/corotls/detail/config.hpp>
#include <boost/corotls/tls/context.hpp>
#include <boost/corotls/tls/engine.hpp>
#include <boost/system/error_category.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/result.hpp>

#include <memory>
#include <string_view>

namespace boost::corotls::tls {

/** Return the category of errors reported by OpenSSL.

    Values are codes from `ERR_get_error`. Every error in this
    category compares equal to @ref condition::invalid_data.
*/
BOOST_COROTLS_DECL
system::error_category const&
openssl_category() noexcept;

/** Wrap a code from `ERR_get_error` in @ref openssl_category.

    The code keeps its low 32 bits, which hold the whole packed
    value including the system error flag of OpenSSL 3.
*/
BOOST_COROTLS_DECL
system::error_code
make_openssl_error( unsigned long err ) noexcept;

/** A TLS engine using OpenSSL.

    Ciphertext crosses between OpenSSL and the buffering strategy
    through a BIO pair; the regions handed to the strategy are
    the BIO pair's own buffers.

    @par Thread Safety
    Distinct objects: Safe.@n
    Shared objects: Unsafe.

    @par Example
    @code
    tls::context ctx;
    ctx.set_verify_mode( tls::verify_mode::peer );

    auto eng = tls::openssl_engine::create(
        ctx, tls::role::client, "example.com" ).value();
    corotls::stream s( std::move( sock ), std::move( eng ) );
    @endcode
*/
class BOOST_COROTLS_DECL openssl_engine : public engine
{
    struct impl;
    std::unique_ptr<impl> impl_;

    explicit openssl_engine( std::unique_ptr<impl> p );

public:
    /** Create an engine.

        The native context is built from `ctx` on first use and
        shared by every engine created from the same context.

        @param ctx The TLS context holding the configuration.
        @param r The handshake role.
        @param server_name For clients, the name sent in SNI and
            checked against the server certificate. When empty,
            the hostname of `ctx` is used.
        @param gen For clients, an optional session identifier
            generator. Its result is offered as a TLS 1.2 session
            identifier in the ClientHello.

        @return The engine, or the OpenSSL error which prevented
            its creation, such as a malformed certificate or key
            in `ctx` or a cipher list naming no known cipher.
    */
    static
    system::result<std::unique_ptr<engine>>
    create(
        context const& ctx,
        role r,
        std::string_view server_name = {},
        session_id_generator gen = {} );

    ~openssl_engine() override;

    transfer read_tls( ciphertext_source& src ) override;
    system::error_code process_new_packets() override;
    transfer read_plaintext( capy::mutable_buffer dest ) override;
    transfer write_plaintext( capy::const_buffer src ) override;
    system::error_code flush_plaintext() override;
    transfer write_tls( ciphertext_sink& sink ) override;

    bool wants_read() const noexcept override;
    bool wants_write() const noexcept override;
    bool is_handshaking() const noexcept override;
    bool peer_has_closed() const noexcept override;

    system::error_code send_close_notify() override;
    role get_role() const noexcept override;

    /** Return the native `SSL*` handle.

        @return The `SSL` object as `void*`.
    */
    void* native_handle() noexcept;
};

} // namespace boost::corotls::tls

#endif
