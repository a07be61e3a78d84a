//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corosio
//

#ifndef BOOST_COROTLS_WOLFSSL_HPP
#define BOOST_COROTLS_WOLFSSL_HPP

#include <boost/corotls/connect.hpp>
#include <boost/corotls/tls/wolfssl_engine.hpp>

namespace boost::corotls {

/** A connector creating @ref tls::wolfssl_engine sessions.

    @note `connect_with_session_id_generator` fails with
        `errc::not_supported`.
*/
using wolfssl_connector = basic_connector<tls::wolfssl_engine>;

/// An acceptor creating @ref tls::wolfssl_engine sessions.
using wolfssl_acceptor = basic_acceptor<tls::wolfssl_engine>;

} // namespace boost::corotls

#endif
