//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corosio
//

#ifndef SRC_TLS_DETAIL_CONTEXT_IMPL_HPP
#define SRC_TLS_DETAIL_CONTEXT_IMPL_HPP

#include <boost/corotls/tls/context.hpp>
#include <boost/system/result.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace boost::corotls::tls {

namespace detail {

/// A backend's native context, built from one context_data.
class native_context_base
{
public:
    virtual ~native_context_base() = default;
};

struct context_data
{
    // PEM, entity certificate first
    std::string chain;
    std::string key;

    std::vector<std::string> authorities;
    bool system_store = false;

    version min_version = version::tls_1_2;
    version max_version = version::tls_1_3;
    std::string cipher_list;

    verify_mode mode = verify_mode::none;
    int verify_depth = 100;
    std::string hostname;
    std::function<bool( std::string_view )> on_servername;

    /** Return the native context a backend keyed by `key` built.

        The first call for a key runs `build`, which returns a
        `system::result<std::unique_ptr<native_context_base>>`.
        A failed build is not remembered, so every engine
        created from bad settings reports the error.
    */
    template<class Build>
    system::result<native_context_base*>
    native( void const* key, Build&& build ) const
    {
        std::lock_guard<std::mutex> lock( natives_mutex_ );
        for( auto const& e : natives_ )
            if( e.key == key )
                return e.ctx.get();

        auto r = build();
        if( r.has_error() )
            return r.error();
        natives_.push_back( { key, std::move( *r ) } );
        return natives_.back().ctx.get();
    }

private:
    struct native_entry
    {
        void const* key;
        std::unique_ptr<native_context_base> ctx;
    };

    mutable std::mutex natives_mutex_;
    mutable std::vector<native_entry> natives_;
};

} // namespace detail

struct context::impl : detail::context_data
{
};

namespace detail {

inline context_data const&
get_context_data( context const& ctx ) noexcept
{
    return *ctx.impl_;
}

} // namespace detail

} // namespace boost::corotls::tls

#endif
