//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corosio
//

#ifndef BOOST_COROTLS_CONNECT_HPP
#define BOOST_COROTLS_CONNECT_HPP

#include <boost/corotls/detail/config.hpp>
#include <boost/corotls/async_stream.hpp>
#include <boost/corotls/buffering.hpp>
#include <boost/corotls/stream.hpp>
#include <boost/corotls/tls/context.hpp>
#include <boost/corotls/tls/engine.hpp>
#include <boost/capy/task.hpp>
#include <boost/core/ignore_unused.hpp>
#include <boost/system/result.hpp>

#include <memory>
#include <string>
#include <utility>

namespace boost::corotls {

namespace detail {

template<class Engine, class Buffering, class Transport>
capy::task<system::result<stream<Transport, Buffering>>>
establish(
    tls::context ctx,
    tls::role r,
    std::string server_name,
    tls::session_id_generator gen,
    Transport io)
{
    using result_type = system::result<stream<Transport, Buffering>>;

    auto eng = Engine::create(ctx, r, server_name, std::move(gen));
    if(! eng)
        co_return result_type(system::in_place_error, eng.error());

    stream<Transport, Buffering> s(std::move(io), std::move(*eng));
    auto [ec, info] = co_await s.handshake();
    ignore_unused(info);
    if(ec)
        co_return result_type(system::in_place_error, ec);
    co_return result_type(system::in_place_value, std::move(s));
}

} // namespace detail

/** Establishes client TLS sessions over existing transports.

    A connector holds a shared @ref tls::context and creates one
    engine per connection.

    @par Example
    @code
    corotls::openssl_connector connector(ctx);
    auto r = co_await connector.connect("www.example.com", std::move(sock));
    if(! r)
        co_return r.error();
    auto s = std::move(*r);
    @endcode

    @tparam Engine The engine implementation. Must provide
        `static system::result<std::unique_ptr<tls::engine>>
        create(tls::context const&, tls::role, std::string_view,
        tls::session_id_generator)`.
*/
template<class Engine>
class basic_connector
{
    tls::context ctx_;

public:
    explicit
    basic_connector(tls::context ctx)
        : ctx_(std::move(ctx))
    {
    }

    tls::context const&
    context() const noexcept
    {
        return ctx_;
    }

    /** Perform a client handshake over `io`.

        @param server_name The name sent in SNI and used for
            certificate verification. When empty, the hostname
            configured on the context is used.
        @param io The connected transport.

        @return The established stream, or the error which ended
            the handshake.
    */
    template<class Buffering = copy_buffering, AsyncStream Transport>
    capy::task<system::result<stream<Transport, Buffering>>>
    connect(std::string server_name, Transport io) const
    {
        return detail::establish<Engine, Buffering>(
            ctx_, tls::role::client, std::move(server_name),
            {}, std::move(io));
    }

    /** Perform a client handshake with a chosen session identifier.

        `gen` receives the identifier the engine would send in
        the ClientHello and returns the one sent instead.
    */
    template<class Buffering = copy_buffering, AsyncStream Transport>
    capy::task<system::result<stream<Transport, Buffering>>>
    connect_with_session_id_generator(
        std::string server_name,
        Transport io,
        tls::session_id_generator gen) const
    {
        return detail::establish<Engine, Buffering>(
            ctx_, tls::role::client, std::move(server_name),
            std::move(gen), std::move(io));
    }
};

/** Establishes server TLS sessions over accepted transports.

    @tparam Engine As for @ref basic_connector.
*/
template<class Engine>
class basic_acceptor
{
    tls::context ctx_;

public:
    explicit
    basic_acceptor(tls::context ctx)
        : ctx_(std::move(ctx))
    {
    }

    tls::context const&
    context() const noexcept
    {
        return ctx_;
    }

    /// Perform a server handshake over `io`.
    template<class Buffering = copy_buffering, AsyncStream Transport>
    capy::task<system::result<stream<Transport, Buffering>>>
    accept(Transport io) const
    {
        return detail::establish<Engine, Buffering>(
            ctx_, tls::role::server, {}, {}, std::move(io));
    }
};

} // namespace boost::corotls

#endif
