//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corosio
//

#include <boost/corotls/tls/wolfssl_engine.hpp>
#include <boost/corotls/error.hpp>
#include <boost/system/errc.hpp>

// Internal context implementation
#include "src/tls/detail/context_impl.hpp"

// Include WolfSSL options first to get proper feature detection
#include <wolfssl/options.h>
#include <wolfssl/ssl.h>
#include <wolfssl/error-ssl.h>

#include <algorithm>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

/*
    wolfssl_engine Architecture
    ===========================

    A synchronous TLS session; the stream performs all I/O.

    Data Flow
    ---------
    write_plaintext -> wolfSSL_write -> send_callback -> out_ -> sink -> transport
    read_plaintext <- plain_ <- wolfSSL_read <- recv_callback <- in_ <- stage_ <- source <- transport

    The callbacks never block. recv_callback answers WANT_READ when
    in_ is exhausted, or CONN_CLOSE after the source reported end of
    input. send_callback copies into out_ while it has room and
    answers WANT_WRITE otherwise; WolfSSL keeps the record and sends
    it again on its next call.

    stage_ and out_ have a fixed size and are never reallocated.
    While the sink holds a region of out_, send_callback only appends
    after it and never compacts, so a borrowing strategy sees the same
    bytes when it repeats a call.

    WolfSSL Context Initialization
    ------------------------------
    Standard WolfSSL builds only expose separate client and server
    methods, so the native context caches one WOLFSSL_CTX per role.
*/

namespace boost::corotls::tls {

namespace {

// Largest plaintext record
constexpr std::size_t max_record = 16384;

// Region offered to the source by read_tls
constexpr std::size_t stage_size = 16384;

// Unconsumed ciphertext beyond which read_tls refuses more
constexpr std::size_t max_pending_input = 4 * stage_size;

// Size of the outgoing ciphertext buffer
constexpr std::size_t out_size = 4 * stage_size;

class wolfssl_error_category
    : public system::error_category
{
public:
    char const*
    name() const noexcept override
    {
        return "wolfssl";
    }

    std::string
    message( int ev ) const override
    {
        char buf[WOLFSSL_MAX_ERROR_SZ];
        wolfSSL_ERR_error_string_n(
            static_cast<unsigned long>( ev ), buf, sizeof( buf ) );
        return buf;
    }

    system::error_condition
    default_error_condition( int ) const noexcept override
    {
        return condition::invalid_data;
    }
};

system::error_code
make_wolfssl_error( int err )
{
    if( err == 0 )
        return error::protocol_error;
    return system::error_code( err, wolfssl_category() );
}

} // namespace

system::error_category const&
wolfssl_category() noexcept
{
    static wolfssl_error_category const cat;
    return cat;
}

//------------------------------------------------------------------------------
//
// Native context
//
//------------------------------------------------------------------------------

namespace detail {

namespace {

// Maps a WolfSSL status to an error; WOLFSSL_SUCCESS is not one.
system::error_code
check_status( int ret )
{
    if( ret == WOLFSSL_SUCCESS )
        return {};
    return make_wolfssl_error( ret );
}

unsigned char const*
bytes( std::string const& s ) noexcept
{
    return reinterpret_cast<unsigned char const*>( s.data() );
}

long
length( std::string const& s ) noexcept
{
    return static_cast<long>( s.size() );
}

// Both WOLFSSL_CTX objects built from one tls::context
class wolfssl_native_context
    : public native_context_base
{
public:
    WOLFSSL_CTX* client = nullptr;
    WOLFSSL_CTX* server = nullptr;

    ~wolfssl_native_context() override
    {
        if( client )
            wolfSSL_CTX_free( client );
        if( server )
            wolfSSL_CTX_free( server );
    }
};

system::error_code
configure( WOLFSSL_CTX* ctx, context_data const& cd )
{
    system::error_code ec = check_status( wolfSSL_CTX_SetMinVersion( ctx,
        cd.min_version == version::tls_1_3 ? WOLFSSL_TLSV1_3 : WOLFSSL_TLSV1_2 ) );
    if( ec )
        return ec;

    if( !cd.chain.empty() )
    {
        ec = check_status( wolfSSL_CTX_use_certificate_chain_buffer(
            ctx, bytes( cd.chain ), length( cd.chain ) ) );
        if( ec )
            return ec;
    }

    if( !cd.key.empty() )
    {
        ec = check_status( wolfSSL_CTX_use_PrivateKey_buffer(
            ctx, bytes( cd.key ), length( cd.key ), WOLFSSL_FILETYPE_PEM ) );
        if( ec )
            return ec;
    }

    if( !cd.chain.empty() && !cd.key.empty() )
    {
        ec = check_status( wolfSSL_CTX_check_private_key( ctx ) );
        if( ec )
            return ec;
    }

    for( auto const& pem : cd.authorities )
    {
        ec = check_status( wolfSSL_CTX_load_verify_buffer(
            ctx, bytes( pem ), length( pem ), WOLFSSL_FILETYPE_PEM ) );
        if( ec )
            return ec;
    }

    if( cd.system_store )
    {
        ec = check_status( wolfSSL_CTX_load_system_CA_certs( ctx ) );
        if( ec )
            return ec;
    }

    if( !cd.cipher_list.empty() )
    {
        ec = check_status( wolfSSL_CTX_set_cipher_list(
            ctx, cd.cipher_list.c_str() ) );
        if( ec )
            return ec;
    }

    int flags = WOLFSSL_VERIFY_NONE;
    if( cd.mode == verify_mode::peer )
        flags = WOLFSSL_VERIFY_PEER;
    else if( cd.mode == verify_mode::require_peer )
        flags = WOLFSSL_VERIFY_PEER | WOLFSSL_VERIFY_FAIL_IF_NO_PEER_CERT;
    wolfSSL_CTX_set_verify( ctx, flags, nullptr );
    wolfSSL_CTX_set_verify_depth( ctx, cd.verify_depth );
    return {};
}

system::result<std::unique_ptr<native_context_base>>
build_wolfssl_context( context_data const& cd )
{
    // A TLS 1.2 ceiling selects the version-specific methods
    bool const tls12_only = cd.max_version == version::tls_1_2;

    auto native = std::make_unique<wolfssl_native_context>();
    native->client = wolfSSL_CTX_new( tls12_only
        ? wolfTLSv1_2_client_method() : wolfTLS_client_method() );
    native->server = wolfSSL_CTX_new( tls12_only
        ? wolfTLSv1_2_server_method() : wolfTLS_server_method() );
    if( !native->client || !native->server )
        return system::error_code(
            make_error_code( system::errc::not_enough_memory ) );

    if( auto ec = configure( native->client, cd ) )
        return ec;
    if( auto ec = configure( native->server, cd ) )
        return ec;
    return std::unique_ptr<native_context_base>( std::move( native ) );
}

} // namespace

system::result<WOLFSSL_CTX*>
get_wolfssl_context( context_data const& cd, role r )
{
    static char const key = 0;
    auto native = cd.native( &key, [&cd]
    {
        return build_wolfssl_context( cd );
    } );
    if( native.has_error() )
        return native.error();
    auto* p = static_cast<wolfssl_native_context*>( *native );
    return r == role::client ? p->client : p->server;
}

} // namespace detail

//------------------------------------------------------------------------------

struct wolfssl_engine::impl
{
    context ctx_;           // holds ref to cached native context
    role role_;
    WOLFSSL* ssl_ = nullptr;

    // Region offered to the ciphertext source
    std::vector<char> stage_;

    // Received ciphertext not yet consumed by WolfSSL
    std::vector<char> in_;
    std::size_t in_pos_ = 0;

    // Produced ciphertext not yet taken by the sink is
    // out_[out_pos_, out_end_)
    std::vector<char> out_;
    std::size_t out_pos_ = 0;
    std::size_t out_end_ = 0;

    // The sink recorded a region of out_ and has not completed it
    bool out_lent_ = false;

    // Decrypted data not yet read by the caller
    std::vector<char> plain_;
    std::size_t plain_pos_ = 0;

    bool started_ = false;
    bool handshake_done_ = false;
    bool eof_ = false;
    bool peer_closed_ = false;

    impl( context const& ctx, role r )
        : ctx_( ctx )
        , role_( r )
        , stage_( stage_size )
        , out_( out_size )
    {
    }

    ~impl()
    {
        if( ssl_ )
            wolfSSL_free( ssl_ );
        // WOLFSSL_CTX* is owned by cached native context, not freed here
    }

    static int
    recv_callback( WOLFSSL*, char* buf, int sz, void* ctx )
    {
        auto* d = static_cast<impl*>( ctx );
        std::size_t const available = d->in_.size() - d->in_pos_;
        if( available == 0 )
        {
            if( d->eof_ )
                return WOLFSSL_CBIO_ERR_CONN_CLOSE;
            return WOLFSSL_CBIO_ERR_WANT_READ;
        }

        std::size_t const n = (std::min)( available, static_cast<std::size_t>( sz ) );
        std::memcpy( buf, d->in_.data() + d->in_pos_, n );
        d->in_pos_ += n;
        if( d->in_pos_ == d->in_.size() )
        {
            d->in_.clear();
            d->in_pos_ = 0;
        }
        return static_cast<int>( n );
    }

    static int
    send_callback( WOLFSSL*, char* buf, int sz, void* ctx )
    {
        auto* d = static_cast<impl*>( ctx );
        if( !d->out_lent_ && d->out_pos_ > 0 )
        {
            std::memmove( d->out_.data(),
                d->out_.data() + d->out_pos_, d->out_end_ - d->out_pos_ );
            d->out_end_ -= d->out_pos_;
            d->out_pos_ = 0;
        }

        std::size_t const room = d->out_.size() - d->out_end_;
        if( room == 0 )
            return WOLFSSL_CBIO_ERR_WANT_WRITE;
        std::size_t const n = (std::min)( room, static_cast<std::size_t>( sz ) );
        std::memcpy( d->out_.data() + d->out_end_, buf, n );
        d->out_end_ += n;
        return static_cast<int>( n );
    }

    system::error_code
    init_ssl( std::string_view server_name )
    {
        auto& cd = detail::get_context_data( ctx_ );
        auto native_ctx = detail::get_wolfssl_context( cd, role_ );
        if( native_ctx.has_error() )
            return native_ctx.error();

        ssl_ = wolfSSL_new( *native_ctx );
        if( !ssl_ )
            return make_wolfssl_error( wolfSSL_get_error( nullptr, 0 ) );

        wolfSSL_SSLSetIORecv( ssl_, &recv_callback );
        wolfSSL_SSLSetIOSend( ssl_, &send_callback );
        wolfSSL_SetIOReadCtx( ssl_, this );
        wolfSSL_SetIOWriteCtx( ssl_, this );

        if( role_ == role::server )
            return {};

        std::string host( server_name );
        if( host.empty() )
            host = cd.hostname;
        if( host.empty() )
            return {};

        auto ec = detail::check_status( wolfSSL_UseSNI(
            ssl_, WOLFSSL_SNI_HOST_NAME, host.data(),
            static_cast<unsigned short>( host.size() ) ) );
        if( ec )
            return ec;
        return detail::check_status(
            wolfSSL_check_domain_name( ssl_, host.c_str() ) );
    }

    // Translate a failed wolfSSL_* return value.
    // Returns true when the call only needs more I/O.
    bool
    check( int ret, system::error_code& ec )
    {
        int const err = wolfSSL_get_error( ssl_, ret );
        switch( err )
        {
        case WOLFSSL_ERROR_WANT_READ:
        case WOLFSSL_ERROR_WANT_WRITE:
            return true;

        case WOLFSSL_ERROR_ZERO_RETURN:
            peer_closed_ = true;
            return true;

        case SOCKET_PEER_CLOSED_E:
            // End of input without close_notify; the stream
            // reports it from the zero-length read.
            return true;

        default:
            ec = make_wolfssl_error( err );
            return false;
        }
    }

    int
    do_handshake()
    {
        started_ = true;
        return role_ == role::client
            ? wolfSSL_connect( ssl_ )
            : wolfSSL_accept( ssl_ );
    }

    std::size_t
    pending_plain() const noexcept
    {
        return plain_.size() - plain_pos_;
    }

    bool
    wants_write() const noexcept
    {
        if( out_pos_ < out_end_ )
            return true;
        return role_ == role::client && !started_;
    }
};

//------------------------------------------------------------------------------

wolfssl_engine::
wolfssl_engine( std::unique_ptr<impl> p )
    : impl_( std::move( p ) )
{
}

wolfssl_engine::
~wolfssl_engine() = default;

system::result<std::unique_ptr<engine>>
wolfssl_engine::
create(
    context const& ctx,
    role r,
    std::string_view server_name,
    session_id_generator gen )
{
    if( gen )
        return system::error_code(
            make_error_code( system::errc::not_supported ) );

    auto p = std::make_unique<impl>( ctx, r );
    auto ec = p->init_ssl( server_name );
    if( ec )
        return ec;
    return std::unique_ptr<engine>( new wolfssl_engine( std::move( p ) ) );
}

transfer
wolfssl_engine::
read_tls( ciphertext_source& src )
{
    auto& d = *impl_;
    if( d.eof_ )
        return transfer::delivered( 0 );
    if( d.in_.size() - d.in_pos_ >= max_pending_input )
        return transfer::failed( error::engine_buffer_full );

    auto t = src.read(
        capy::mutable_buffer( d.stage_.data(), d.stage_.size() ),
        owner() );
    if( t.state() != transfer::kind::delivered )
        return t;

    if( t.bytes() == 0 )
    {
        d.eof_ = true;
        return t;
    }
    d.in_.insert( d.in_.end(),
        d.stage_.data(), d.stage_.data() + t.bytes() );
    return t;
}

system::error_code
wolfssl_engine::
process_new_packets()
{
    auto& d = *impl_;
    system::error_code ec;

    if( !d.handshake_done_ )
    {
        int const ret = d.do_handshake();
        if( ret != WOLFSSL_SUCCESS )
        {
            if( !d.check( ret, ec ) )
                return ec;
            return {};
        }
        d.handshake_done_ = true;
    }

    if( d.plain_pos_ == d.plain_.size() )
    {
        d.plain_.clear();
        d.plain_pos_ = 0;
    }

    while( !d.peer_closed_ )
    {
        std::size_t const old = d.plain_.size();
        d.plain_.resize( old + max_record );
        int const ret = wolfSSL_read(
            d.ssl_, d.plain_.data() + old, static_cast<int>( max_record ) );
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
wolfssl_engine::
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
wolfssl_engine::
write_plaintext( capy::const_buffer src )
{
    if( src.size() == 0 )
        return transfer::delivered( 0 );

    int const len = static_cast<int>( (std::min)( src.size(), max_record ) );
    int const ret = wolfSSL_write( impl_->ssl_, src.data(), len );
    if( ret > 0 )
        return transfer::delivered( static_cast<std::size_t>( ret ) );

    system::error_code ec;
    if( impl_->check( ret, ec ) )
        return transfer::needs_io();
    return transfer::failed( ec );
}

system::error_code
wolfssl_engine::
flush_plaintext()
{
    // wolfSSL_write produces its records immediately
    return {};
}

transfer
wolfssl_engine::
write_tls( ciphertext_sink& sink )
{
    auto& d = *impl_;
    if( d.role_ == role::client && !d.started_ )
    {
        // Queue the ClientHello
        int const ret = d.do_handshake();
        system::error_code ec;
        if( ret != WOLFSSL_SUCCESS && !d.check( ret, ec ) )
            return transfer::failed( ec );
    }

    if( d.out_pos_ == d.out_end_ )
        return transfer::delivered( 0 );

    auto t = sink.write(
        capy::const_buffer(
            d.out_.data() + d.out_pos_, d.out_end_ - d.out_pos_ ),
        owner() );
    d.out_lent_ = t.state() == transfer::kind::needs_io;
    if( t.state() == transfer::kind::delivered )
    {
        d.out_pos_ += t.bytes();
        if( d.out_pos_ == d.out_end_ )
        {
            d.out_pos_ = 0;
            d.out_end_ = 0;
        }
    }
    return t;
}

bool
wolfssl_engine::
wants_read() const noexcept
{
    auto const& d = *impl_;
    if( d.peer_closed_ || d.pending_plain() > 0 )
        return false;
    return d.handshake_done_ || !d.wants_write();
}

bool
wolfssl_engine::
wants_write() const noexcept
{
    return impl_->wants_write();
}

bool
wolfssl_engine::
is_handshaking() const noexcept
{
    return !impl_->handshake_done_;
}

bool
wolfssl_engine::
peer_has_closed() const noexcept
{
    return impl_->peer_closed_;
}

system::error_code
wolfssl_engine::
send_close_notify()
{
    auto& d = *impl_;
    if( !d.handshake_done_ )
        return {};

    int const ret = wolfSSL_shutdown( d.ssl_ );
    if( ret == WOLFSSL_SUCCESS || ret == WOLFSSL_SHUTDOWN_NOT_DONE )
        return {};

    system::error_code ec;
    if( !d.check( ret, ec ) )
        return ec;
    return {};
}

role
wolfssl_engine::
get_role() const noexcept
{
    return impl_->role_;
}

void*
wolfssl_engine::
native_handle() noexcept
{
    return impl_->ssl_;
}

} // namespace boost::corotls::tls
