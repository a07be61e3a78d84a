//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corosio
//

#ifndef BOOST_COROTLS_TLS_CONTEXT_HPP
#define BOOST_COROTLS_TLS_CONTEXT_HPP

#include <boost/corotls/detail/config.hpp>
#include <boost/system/result.hpp>

#include <functional>
#include <memory>
#include <string_view>

namespace boost::corotls::tls {

/// The side of the handshake an engine plays.
enum class role
{
    client,
    server
};

/// A TLS protocol version.
enum class version
{
    tls_1_2,
    tls_1_3
};

/** How the peer certificate is checked.

    @see context::set_verify_mode
*/
enum class verify_mode
{
    /// The peer certificate is neither requested nor checked.
    none,

    /// A certificate the peer presents must verify.
    peer,

    /// The peer must present a certificate, and it must verify.
    require_peer
};

class context;

namespace detail {
struct context_data;
context_data const&
get_context_data( context const& ) noexcept;
} // namespace detail

/** Settings shared by the engines of one endpoint.

    A context holds the credentials, trust anchors and protocol
    limits engines are created with. Copies refer to the same
    settings. All certificate and key material is PEM.

    A backend turns the settings into its native context when
    the first engine is created from them; errors in the
    material, such as a malformed key or a cipher list which
    names no cipher, are reported by that engine's `create`.
    Later changes to the context are not seen by the backend.

    @par Thread Safety
    Distinct objects: Safe.@n
    Shared objects: Unsafe.
*/
#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable: 4251)  // shared_ptr needs dll-interface
#endif
class BOOST_COROTLS_DECL context
{
    struct impl;
    std::shared_ptr<impl> impl_;

    friend
    detail::context_data const&
    detail::get_context_data( context const& ) noexcept;

public:
    /// Construct a context with no credentials and no verification.
    context();

    /** Present a certificate chain.

        @param pem The entity certificate, optionally followed
            by its intermediate certificates.
    */
    void
    use_certificate_chain( std::string_view pem );

    /// Present the certificate chain stored in a file.
    system::result<void>
    use_certificate_chain_file( std::string_view path );

    /// Use the private key matching the certificate chain.
    void
    use_private_key( std::string_view pem );

    /// Use the private key stored in a file.
    system::result<void>
    use_private_key_file( std::string_view path );

    /** Trust the certificate authorities in a PEM text.

        May be called more than once; every authority added
        is trusted.
    */
    void
    add_certificate_authority( std::string_view pem );

    /// Trust the certificate authorities stored in a file.
    system::result<void>
    load_verify_file( std::string_view path );

    /// Trust the system's default certificate store as well.
    void
    set_default_verify_paths();

    /** Limit the protocol versions offered and accepted.

        The default range is TLS 1.2 to TLS 1.3.

        @return `errc::invalid_argument` if `lo` is newer than `hi`.
    */
    system::result<void>
    set_protocol_versions( version lo, version hi );

    /** Restrict the TLS 1.2 cipher suites.

        @param ciphers An OpenSSL style cipher list. TLS 1.3
            suites are not affected.
    */
    void
    set_ciphersuites( std::string_view ciphers );

    /// Choose how the peer certificate is checked.
    void
    set_verify_mode( verify_mode mode );

    /** Limit the length of a verified certificate chain.

        @return `errc::invalid_argument` if `depth` is negative.
    */
    system::result<void>
    set_verify_depth( int depth );

    /** Set the name a client expects the server to prove.

        Used for SNI and the certificate name check when a
        connector is not given a server name of its own.
    */
    void
    set_hostname( std::string_view hostname );

    /** Inspect the name a client asks a server for.

        The callback runs during a server handshake with the
        client's SNI name. Returning `false` aborts the handshake.
    */
    void
    set_servername_callback(
        std::function<bool( std::string_view )> callback );
};
#ifdef _MSC_VER
#pragma warning(pop)
#endif

} // namespace boost::corotls::tls

#endif
