//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corosio
//

#ifndef BOOST_COROTLS_ERROR_HPP
#define BOOST_COROTLS_ERROR_HPP

#include <boost/corotls/detail/config.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/error_condition.hpp>

#include <type_traits>

namespace boost::corotls {

/** Error codes produced by TLS streams.

    Transport errors are passed through unchanged and engine
    diagnostics use the category of the TLS backend. The codes
    below describe failures detected by the stream itself.

    @see condition
*/
enum class error
{
    /// The transport ended before the handshake completed.
    handshake_eof = 1,

    /// The peer closed the session while the handshake was in progress.
    handshake_alert,

    /// The engine rejected incoming data without a diagnostic.
    protocol_error,

    /// The transport accepted zero bytes of ciphertext.
    write_zero,

    /// A borrowed region was released before its transport operation started.
    region_expired,

    /// A borrowed region was presented which differs from the recorded one.
    region_mismatch,

    /// Transport I/O was requested before any region was recorded.
    region_not_recorded,

    /// An operation in the same direction is already in flight.
    operation_in_progress,

    /// The engine has no room for more incoming ciphertext.
    engine_buffer_full,

    /// The halves passed to reunite came from different streams.
    reunite_mismatch
};

/** Portable error conditions for TLS streams.

    Compare an error code against these to classify a failure
    independently of the backend which produced it.

    @par Example
    @code
    auto [ec, n] = co_await s.read( buf );
    if( ec == corotls::condition::unexpected_eof )
        // truncated by the transport
    @endcode
*/
enum class condition
{
    /// The byte stream ended where the protocol required more data.
    unexpected_eof = 1,

    /// The peer sent data the engine could not accept.
    invalid_data
};

/// Return the error category for @ref error.
BOOST_COROTLS_DECL
system::error_category const&
get_error_category() noexcept;

/// Return the error category for @ref condition.
BOOST_COROTLS_DECL
system::error_category const&
get_condition_category() noexcept;

inline system::error_code
make_error_code(error e) noexcept
{
    return system::error_code(
        static_cast<std::underlying_type_t<error>>(e),
        get_error_category());
}

inline system::error_condition
make_error_condition(condition c) noexcept
{
    return system::error_condition(
        static_cast<std::underlying_type_t<condition>>(c),
        get_condition_category());
}

} // namespace boost::corotls

namespace boost::system {

template<>
struct is_error_code_enum<::boost::corotls::error>
{
    static bool const value = true;
};

template<>
struct is_error_condition_enum<::boost::corotls::condition>
{
    static bool const value = true;
};

} // namespace boost::system

#endif
