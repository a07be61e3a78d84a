//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corosio
//

#ifndef BOOST_COROTLS_DETAIL_CONFIG_HPP
#define BOOST_COROTLS_DETAIL_CONFIG_HPP

#include <boost/config.hpp>

#if defined(BOOST_COROTLS_DOCS)
# define BOOST_COROTLS_DECL
#else
# if (defined(BOOST_COROTLS_DYN_LINK) || defined(BOOST_ALL_DYN_LINK)) && !defined(BOOST_COROTLS_STATIC_LINK)
#  if defined(BOOST_COROTLS_SOURCE)
#   define BOOST_COROTLS_DECL BOOST_SYMBOL_EXPORT
#  else
#   define BOOST_COROTLS_DECL BOOST_SYMBOL_IMPORT
#  endif
# endif
# ifndef BOOST_COROTLS_DECL
#  define BOOST_COROTLS_DECL
# endif
#endif

#endif
