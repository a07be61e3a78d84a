//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corosio
//

#ifndef BOOST_COROTLS_TLS_WOLFSSL_ENGINE_HPP
#define BOOST_COROTLS_TLS_WOLFSSL_ENGINE_HPP

#include <boost/corotls/detail/config.hpp>
#include <boost/corotls/tls/context.hpp>
#include <boost/corotls/tls/engine.hpp>
#include <boost/system/error_category.hpp>
#include <boost/system/result.hpp>

#include <memory>
#include <string_view>

namespace boost::corotls::tls {

/** Return the category of errors reported by WolfSSL.

    Every error in this category compares equal to
    @ref condition::invalid_data.
*/
BOOST_COROTLS_DECL
system::error_category const&
wolfssl_category() noexcept;

/** A TLS engine using WolfSSL.

    Ciphertext crosses between WolfSSL and the buffering strategy
    through the custom I/O callbacks, staged in buffers owned by
    the engine.

    @par Thread Safety
    Distinct objects: Safe.@n
    Shared objects: Unsafe.
*/
class BOOST_COROTLS_DECL wolfssl_engine : public engine
{
    struct impl;
    std::unique_ptr<impl> impl_;

    explicit wolfssl_engine( std::unique_ptr<impl> p );

public:
    /** Create an engine.

        @param ctx The TLS context holding the configuration.
        @param r The handshake role.
        @param server_name For clients, the name sent in SNI and
            checked against the server certificate. When empty,
            the hostname of `ctx` is used.
        @param gen Must be empty; WolfSSL does not let the caller
            choose the ClientHello session identifier.

        @return The engine, or `errc::not_supported` when `gen`
            is set, or the WolfSSL error which prevented its
            creation.
    */
    static
    system::result<std::unique_ptr<engine>>
    create(
        context const& ctx,
        role r,
        std::string_view server_name = {},
        session_id_generator gen = {} );

    ~wolfssl_engine() override;

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

    /** Return the native `WOLFSSL*` handle.

        @return The `WOLFSSL` object as `void*`.
    */
    void* native_handle() noexcept;
};

} // namespace boost::corotls::tls

#endif
