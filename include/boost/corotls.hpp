//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corosio
//

#ifndef BOOST_COROTLS_HPP
#define BOOST_COROTLS_HPP

#include <boost/corotls/async_stream.hpp>
#include <boost/corotls/buffering.hpp>
#include <boost/corotls/connect.hpp>
#include <boost/corotls/error.hpp>
#include <boost/corotls/local_context.hpp>
#include <boost/corotls/split.hpp>
#include <boost/corotls/stream.hpp>
#include <boost/corotls/transfer.hpp>

#include <boost/corotls/tls/context.hpp>
#include <boost/corotls/tls/engine.hpp>
#include <boost/corotls/openssl.hpp>
#include <boost/corotls/wolfssl.hpp>

#endif
