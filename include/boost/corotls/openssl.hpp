//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corosio
//

#ifndef BOOST_COROTLS_OPENSSL_HPP
#define BOOST_COROTLS_OPENSSL_HPP

#include <boost/corotls/connect.hpp>
#include <boost/corotls/tls/openssl_engine.hpp>

namespace boost::corotls {

/// A connector creating @ref tls::openssl_engine sessions.
using openssl_connector = basic_connector<tls::openssl_engine>;

/// An acceptor creating @ref tls::openssl_engine sessions.
using openssl_acceptor = basic_acceptor<tls::openssl_engine>;

} // namespace boost::corotls

#endif
