//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corosio
//

#include <boost/corotls/tls/context.hpp>
#include "src/tls/detail/context_impl.hpp"

#include <boost/system/errc.hpp>

#include <cerrno>
#include <fstream>
#include <iterator>

namespace boost::corotls::tls {

namespace {

// Replaces `dest` only when the whole file was read.
system::result<void>
read_file( std::string_view path, std::string& dest )
{
    std::ifstream f( std::string( path ), std::ios::binary );
    if( !f )
        return system::error_code( ENOENT, system::generic_category() );

    std::string text(
        ( std::istreambuf_iterator<char>( f ) ),
        std::istreambuf_iterator<char>() );
    if( f.bad() )
        return system::error_code( EIO, system::generic_category() );
    dest = std::move( text );
    return {};
}

system::error_code
invalid_argument() noexcept
{
    return make_error_code( system::errc::invalid_argument );
}

} // namespace

context::
context()
    : impl_( std::make_shared<impl>() )
{
}

void
context::
use_certificate_chain( std::string_view pem )
{
    impl_->chain = pem;
}

system::result<void>
context::
use_certificate_chain_file( std::string_view path )
{
    return read_file( path, impl_->chain );
}

void
context::
use_private_key( std::string_view pem )
{
    impl_->key = pem;
}

system::result<void>
context::
use_private_key_file( std::string_view path )
{
    return read_file( path, impl_->key );
}

void
context::
add_certificate_authority( std::string_view pem )
{
    impl_->authorities.emplace_back( pem );
}

system::result<void>
context::
load_verify_file( std::string_view path )
{
    std::string pem;
    auto r = read_file( path, pem );
    if( r.has_error() )
        return r;
    impl_->authorities.push_back( std::move( pem ) );
    return {};
}

void
context::
set_default_verify_paths()
{
    impl_->system_store = true;
}

system::result<void>
context::
set_protocol_versions( version lo, version hi )
{
    if( lo > hi )
        return invalid_argument();
    impl_->min_version = lo;
    impl_->max_version = hi;
    return {};
}

void
context::
set_ciphersuites( std::string_view ciphers )
{
    impl_->cipher_list = ciphers;
}

void
context::
set_verify_mode( verify_mode mode )
{
    impl_->mode = mode;
}

system::result<void>
context::
set_verify_depth( int depth )
{
    if( depth < 0 )
        return invalid_argument();
    impl_->verify_depth = depth;
    return {};
}

void
context::
set_hostname( std::string_view hostname )
{
    impl_->hostname = hostname;
}

void
context::
set_servername_callback(
    std::function<bool( std::string_view )> callback )
{
    impl_->on_servername = std::move( callback );
}

} // namespace boost::corotls::tls
