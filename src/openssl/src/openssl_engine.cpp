//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corosio
//

#include <boost/corotls/tls/openssl_engine.hpp>
#include <boost/corotls/error.hpp>

// Internal context implementation
#include "src/tls/detail/context_impl.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/bio.h>
#include <openssl/rand.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <climits>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

/*
    openssl_engine Architecture
    ===========================

    A synchronous TLS session; the stream performs all I/O.

    Data Flow (using BIO pairs)
    ---------------------------
    write_plaintext -> SSL_write -> int_bio -> BIO_nread0(ext_bio) -> sink -> transport
    read_plaintext <- plain_ <- SSL_read <- int_bio <- BIO_nwrite0(ext_bio) <- source <- transport

    The regions handed to the source and sink are the BIO pair's own
    ring buffers, obtained with BIO_nwrite0 and BIO_nread0. They are
    committed with BIO_nwrite and BIO_nread only once the strategy
    reports how many bytes it moved, so a strategy answering needs_io
    leaves the BIO untouched and sees the same region on the retry.

    Decrypted records are drained into plain_ by process_new_packets,
    which keeps the BIO from filling up while the caller is not
    reading.
*/

namespace boost::corotls::tls {

namespace {

// Plaintext decrypted per SSL_read call
constexpr std::size_t read_chunk = 16384;

// Legacy session identifier offered with a generator
constexpr std::size_t session_id_size = 32;

class openssl_error_category
    : public system::error_category
{
public:
    char const*
    name() const noexcept override
    {
        return "openssl";
    }

    std::string
    message( int ev ) const override
    {
        // Codes are stored as the low 32 bits of the packed value
        char buf[256];
        ERR_error_string_n(
            static_cast<unsigned long>( static_cast<unsigned int>( ev ) ),
            buf, sizeof( buf ) );
        return buf;
    }

    system::error_condition
    default_error_condition( int ) const noexcept override
    {
        return condition::invalid_data;
    }
};

// Collect the first queued OpenSSL error, clearing the queue.
system::error_code
last_error()
{
    unsigned long const err = ERR_get_error();
    ERR_clear_error();
    if( err == 0 )
        return error::protocol_error;
    return make_openssl_error( err );
}

int
to_native( version v ) noexcept
{
    return v == version::tls_1_3 ? TLS1_3_VERSION : TLS1_2_VERSION;
}

} // namespace

system::error_category const&
openssl_category() noexcept
{
    static openssl_error_category const cat;
    return cat;
}

system::error_code
make_openssl_error( unsigned long err ) noexcept
{
    return system::error_code(
        static_cast<int>( static_cast<unsigned int>( err ) ),
        openssl_category() );
}

//------------------------------------------------------------------------------
//
// Native context
//
//------------------------------------------------------------------------------

namespace detail {

namespace {

struct openssl_free
{
    void operator()( BIO* p ) const noexcept { BIO_free( p ); }
    void operator()( X509* p ) const noexcept { X509_free( p ); }
    void operator()( EVP_PKEY* p ) const noexcept { EVP_PKEY_free( p ); }
    void operator()( SSL_CTX* p ) const noexcept { SSL_CTX_free( p ); }
};

template<class T>
using openssl_ptr = std::unique_ptr<T, openssl_free>;

openssl_ptr<BIO>
open_pem( std::string const& pem )
{
    return openssl_ptr<BIO>( BIO_new_mem_buf(
        pem.data(), static_cast<int>( pem.size() ) ) );
}

// Hands each certificate of a PEM text to `f`, in order.
// A text holding no certificate is an error.
template<class F>
system::error_code
for_each_certificate( std::string const& pem, F&& f )
{
    auto bio = open_pem( pem );
    if( !bio )
        return last_error();

    std::size_t n = 0;
    for( ;; )
    {
        openssl_ptr<X509> cert( PEM_read_bio_X509(
            bio.get(), nullptr, nullptr, nullptr ) );
        if( !cert )
            break;
        if( auto ec = f( std::move( cert ), n++ ) )
            return ec;
    }
    if( n == 0 )
        return last_error();

    // The read past the last certificate queues PEM_R_NO_START_LINE
    ERR_clear_error();
    return {};
}

int
servername_index()
{
    static int const index = SSL_CTX_get_ex_new_index(
        0, nullptr, nullptr, nullptr, nullptr );
    return index;
}

int
on_servername( SSL* ssl, int*, void* )
{
    char const* name = SSL_get_servername( ssl, TLSEXT_NAMETYPE_host_name );
    if( !name )
        return SSL_TLSEXT_ERR_NOACK;

    auto const* cd = static_cast<context_data const*>( SSL_CTX_get_ex_data(
        SSL_get_SSL_CTX( ssl ), servername_index() ) );
    if( cd && cd->on_servername && !cd->on_servername( name ) )
        return SSL_TLSEXT_ERR_ALERT_FATAL;
    return SSL_TLSEXT_ERR_OK;
}

system::error_code
apply_protocol( SSL_CTX* ctx, context_data const& cd )
{
    // Partial writes let write_plaintext report what fit into the BIO
    SSL_CTX_set_mode( ctx,
        SSL_MODE_ENABLE_PARTIAL_WRITE |
        SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER );

    if( SSL_CTX_set_min_proto_version( ctx, to_native( cd.min_version ) ) != 1 ||
        SSL_CTX_set_max_proto_version( ctx, to_native( cd.max_version ) ) != 1 )
        return last_error();

    if( !cd.cipher_list.empty() &&
        SSL_CTX_set_cipher_list( ctx, cd.cipher_list.c_str() ) != 1 )
        return last_error();
    return {};
}

system::error_code
apply_identity( SSL_CTX* ctx, context_data const& cd )
{
    if( !cd.chain.empty() )
    {
        auto ec = for_each_certificate( cd.chain,
            [ctx]( openssl_ptr<X509> cert, std::size_t i ) -> system::error_code
            {
                if( i == 0 )
                {
                    if( SSL_CTX_use_certificate( ctx, cert.get() ) != 1 )
                        return last_error();
                    return {};
                }
                // add0 takes ownership only when it succeeds
                if( SSL_CTX_add0_chain_cert( ctx, cert.get() ) != 1 )
                    return last_error();
                cert.release();
                return {};
            } );
        if( ec )
            return ec;
    }

    if( !cd.key.empty() )
    {
        auto bio = open_pem( cd.key );
        if( !bio )
            return last_error();
        openssl_ptr<EVP_PKEY> key( PEM_read_bio_PrivateKey(
            bio.get(), nullptr, nullptr, nullptr ) );
        if( !key || SSL_CTX_use_PrivateKey( ctx, key.get() ) != 1 )
            return last_error();
    }

    if( !cd.chain.empty() && !cd.key.empty() &&
        SSL_CTX_check_private_key( ctx ) != 1 )
        return last_error();
    return {};
}

system::error_code
apply_trust( SSL_CTX* ctx, context_data const& cd )
{
    X509_STORE* store = SSL_CTX_get_cert_store( ctx );
    for( auto const& pem : cd.authorities )
    {
        auto ec = for_each_certificate( pem,
            [store]( openssl_ptr<X509> cert, std::size_t ) -> system::error_code
            {
                if( X509_STORE_add_cert( store, cert.get() ) != 1 )
                    return last_error();
                return {};
            } );
        if( ec )
            return ec;
    }

    if( cd.system_store && SSL_CTX_set_default_verify_paths( ctx ) != 1 )
        return last_error();
    return {};
}

void
apply_verification( SSL_CTX* ctx, context_data const& cd )
{
    int flags = SSL_VERIFY_NONE;
    if( cd.mode == verify_mode::peer )
        flags = SSL_VERIFY_PEER;
    else if( cd.mode == verify_mode::require_peer )
        flags = SSL_VERIFY_PEER | SSL_VERIFY_FAIL_IF_NO_PEER_CERT;
    SSL_CTX_set_verify( ctx, flags, nullptr );
    SSL_CTX_set_verify_depth( ctx, cd.verify_depth );
}

class openssl_native_context
    : public native_context_base
{
public:
    openssl_ptr<SSL_CTX> ctx;
};

system::result<std::unique_ptr<native_context_base>>
build_openssl_context( context_data const& cd )
{
    auto native = std::make_unique<openssl_native_context>();
    native->ctx.reset( SSL_CTX_new( TLS_method() ) );
    SSL_CTX* ctx = native->ctx.get();
    if( !ctx )
        return last_error();

    if( auto ec = apply_protocol( ctx, cd ) )
        return ec;
    if( auto ec = apply_identity( ctx, cd ) )
        return ec;
    if( auto ec = apply_trust( ctx, cd ) )
        return ec;
    apply_verification( ctx, cd );

    if( cd.on_servername )
    {
        if( servername_index() < 0 ||
            SSL_CTX_set_ex_data( ctx, servername_index(),
                const_cast<context_data*>( &cd ) ) != 1 )
            return last_error();
        SSL_CTX_set_tlsext_servername_callback( ctx, on_servername );
    }
    return std::unique_ptr<native_context_base>( std::move( native ) );
}

// The native context is owned by the tls::context it was built from.
system::result<SSL_CTX*>
get_openssl_context( context_data const& cd )
{
    static char const key = 0;
    auto r = cd.native( &key, [&cd]
    {
        return build_openssl_context( cd );
    } );
    if( r.has_error() )
        return r.error();
    return static_cast<openssl_native_context*>( *r )->ctx.get();
}

} // namespace
} // namespace detail

//------------------------------------------------------------------------------

struct openssl_engine::impl
{
    context ctx_;           // holds ref to cached native context
    role role_;
    SSL* ssl_ = nullptr;
    BIO* ext_bio_ = nullptr;

    // Decrypted data not yet read by the caller
    std::vector<char> plain_;
    std::size_t plain_pos_ = 0;

    bool started_ = false;
    bool eof_ = false;
    bool peer_closed_ = false;

    impl( context const& ctx, role r )
        : ctx_( ctx )
        , role_( r )
    {
    }

    ~impl()
    {
        if( ext_bio_ )
            BIO_free( ext_bio_ );
        if( ssl_ )
            SSL_free( ssl_ );
        // SSL_CTX* is owned by cached native context, not freed here
    }

    system::error_code
    init_ssl(
        std::string_view server_name,
        session_id_generator const& gen )
    {
        auto& cd = detail::get_context_data( ctx_ );
        auto native_ctx = detail::get_openssl_context( cd );
        if( native_ctx.has_error() )
            return native_ctx.error();

        ssl_ = SSL_new( *native_ctx );
        if( !ssl_ )
            return last_error();

        BIO* int_bio = nullptr;
        if( !BIO_new_bio_pair( &int_bio, 0, &ext_bio_, 0 ) )
            return last_error();

        // SSL takes ownership of the internal BIO
        SSL_set_bio( ssl_, int_bio, int_bio );

        if( role_ == role::server )
        {
            SSL_set_accept_state( ssl_ );
            return {};
        }

        SSL_set_connect_state( ssl_ );

        std::string host( server_name );
        if( host.empty() )
            host = cd.hostname;
        if( !host.empty() )
        {
            // SNI, and the CN/SAN check of the peer certificate
            if( SSL_set_tlsext_host_name( ssl_, host.c_str() ) != 1 ||
                SSL_set1_host( ssl_, host.c_str() ) != 1 )
                return last_error();
        }

        if( gen )
            return offer_session_id( gen );
        return {};
    }

    // Offer a generated legacy session identifier. A session with an
    // identifier and no ticket is sent verbatim in the ClientHello.
    system::error_code
    offer_session_id( session_id_generator const& gen )
    {
        session_id prior;
        if( RAND_bytes( prior.data(), static_cast<int>( prior.size() ) ) != 1 )
            return last_error();

        session_id const id = gen(
            std::span<unsigned char const>( prior.data(), prior.size() ) );

        SSL_SESSION* sess = SSL_SESSION_new();
        if( !sess )
            return last_error();

        system::error_code ec;
        if( !SSL_SESSION_set_protocol_version( sess, TLS1_2_VERSION ) ||
            !SSL_SESSION_set1_id( sess, id.data(),
                static_cast<unsigned int>( session_id_size ) ) ||
            !SSL_set_session( ssl_, sess ) )
            ec = last_error();

        // SSL_set_session holds its own reference
        SSL_SESSION_free( sess );
        return ec;
    }

    // Translate a failed SSL_* return value.
    // Returns true when the call only needs more I/O.
    bool
    check( int ret, system::error_code& ec )
    {
        switch( SSL_get_error( ssl_, ret ) )
        {
        case SSL_ERROR_WANT_READ:
        case SSL_ERROR_WANT_WRITE:
            return true;

        case SSL_ERROR_ZERO_RETURN:
            peer_closed_ = true;
            return true;

        case SSL_ERROR_SYSCALL:
            if( ERR_peek_error() == 0 )
                return true;
            ec = last_error();
            return false;

        default:
            ec = last_error();
            return false;
        }
    }

    std::size_t
    pending_plain() const noexcept
    {
        return plain_.size() - plain_pos_;
    }

    bool
    handshaking() const noexcept
    {
        return !SSL_is_init_finished( ssl_ );
    }

    bool
    wants_write() const noexcept
    {
        if( BIO_ctrl_pending( ext_bio_ ) > 0 )
            return true;
        return role_ == role::client && !started_;
    }
};

//------------------------------------------------------------------------------

openssl_engine::
openssl_engine( std::unique_ptr<impl> p )
    : impl_( std::move( p ) )
{
}

openssl_engine::
~openssl_engine() = default;

system::result<std::unique_ptr<engine>>
openssl_engine::
create(
    context const& ctx,
    role r,
    std::string_view server_name,
    session_id_generator gen )
{
    auto p = std::make_unique<impl>( ctx, r );
    auto ec = p->init_ssl( server_name, gen );
    if( ec )
        return ec;
    return std::unique_ptr<engine>( new openssl_engine( std::move( p ) ) );
}

transfer
openssl_engine::
read_tls( ciphertext_source& src )
{
    if( impl_->eof_ )
        return transfer::delivered( 0 );

    char* region = nullptr;
    int const room = BIO_nwrite0( impl_->ext_bio_, &region );
    if( room <= 0 )
        return transfer::failed( error::engine_buffer_full );

    auto t = src.read(
        capy::mutable_buffer( region, static_cast<std::size_t>( room ) ),
        owner() );
    if( t.state() != transfer::kind::delivered )
        return t;

    if( t.bytes() == 0 )
    {
        impl_->eof_ = true;
        return t;
    }
    BIO_nwrite( impl_->ext_bio_, &region, static_cast<int>( t.bytes() ) );
    return t;
}

system::error_code
openssl_engine::
process_new_packets()
{
    auto& d = *impl_;
    system::error_code ec;
    ERR_clear_error();

    if( d.handshaking() )
    {
        d.started_ = true;
        int const ret = SSL_do_handshake( d.ssl_ );
        if( ret <= 0 )
        {
            if( !d.check( ret, ec ) )
                return ec;
            if( d.handshaking() )
                return {};
        }
    }

    if( d.plain_pos_ == d.plain_.size() )
    {
        d.plain_.clear();
        d.plain_pos_ = 0;
    }

    while( !d.peer_closed_ )
    {
        std::size_t const old = d.plain_.size();
        d.plain_.resize( old + read_chunk );
        int const ret = SSL_read(
            d.ssl_, d.plain_.data() + old, static_cast<int>( read_chunk ) );
        if( ret > 0 )
        {
            d.plain_.resize( old + static_cast<std::size_t>( ret ) );
            continue;
        }
        d.plain_.resize( old );
        if( !d.check( ret, ec ) )
            return ec;
        break;
    }
    return {};
}

transfer
openssl_engine::
read_plaintext( capy::mutable_buffer dest )
{
    auto& d = *impl_;
    std::size_t const avail = d.pending_plain();
    if( avail > 0 )
    {
        std::size_t const n = (std::min)( avail, dest.size() );
        std::memcpy( dest.data(), d.plain_.data() + d.plain_pos_, n );
        d.plain_pos_ += n;
        if( d.plain_pos_ == d.plain_.size() )
        {
            d.plain_.clear();
            d.plain_pos_ = 0;
        }
        return transfer::delivered( n );
    }
    if( d.peer_closed_ )
        return transfer::delivered( 0 );
    return transfer::needs_io();
}

transfer
openssl_engine::
write_plaintext( capy::const_buffer src )
{
    if( src.size() == 0 )
        return transfer::delivered( 0 );

    ERR_clear_error();
    int const len = static_cast<int>(
        (std::min)( src.size(), static_cast<std::size_t>( INT_MAX ) ) );
    int const ret = SSL_write( impl_->ssl_, src.data(), len );
    if( ret > 0 )
        return transfer::delivered( static_cast<std::size_t>( ret ) );

    system::error_code ec;
    if( impl_->check( ret, ec ) )
        return transfer::needs_io();
    return transfer::failed( ec );
}

system::error_code
openssl_engine::
flush_plaintext()
{
    // SSL_write produces its records immediately
    return {};
}

transfer
openssl_engine::
write_tls( ciphertext_sink& sink )
{
    auto& d = *impl_;
    if( d.role_ == role::client && !d.started_ )
    {
        // Queue the ClientHello
        d.started_ = true;
        ERR_clear_error();
        int const ret = SSL_do_handshake( d.ssl_ );
        system::error_code ec;
        if( ret <= 0 && !d.check( ret, ec ) )
            return transfer::failed( ec );
    }

    char* region = nullptr;
    int const avail = BIO_nread0( d.ext_bio_, &region );
    if( avail <= 0 )
        return transfer::delivered( 0 );

    auto t = sink.write(
        capy::const_buffer( region, static_cast<std::size_t>( avail ) ),
        owner() );
    if( t.state() == transfer::kind::delivered && t.bytes() > 0 )
        BIO_nread( d.ext_bio_, &region, static_cast<int>( t.bytes() ) );
    return t;
}

bool
openssl_engine::
wants_read() const noexcept
{
    auto const& d = *impl_;
    if( d.peer_closed_ || d.pending_plain() > 0 )
        return false;
    return !d.handshaking() || !d.wants_write();
}

bool
openssl_engine::
wants_write() const noexcept
{
    return impl_->wants_write();
}

bool
openssl_engine::
is_handshaking() const noexcept
{
    return impl_->handshaking();
}

bool
openssl_engine::
peer_has_closed() const noexcept
{
    return impl_->peer_closed_;
}

system::error_code
openssl_engine::
send_close_notify()
{
    auto& d = *impl_;
    if( d.handshaking() )
        return {};

    ERR_clear_error();
    int const ret = SSL_shutdown( d.ssl_ );
    system::error_code ec;
    if( ret < 0 && !d.check( ret, ec ) )
        return ec;
    return {};
}

role
openssl_engine::
get_role() const noexcept
{
    return impl_->role_;
}

void*
openssl_engine::
native_handle() noexcept
{
    return impl_->ssl_;
}

} // namespace boost::corotls::tls
