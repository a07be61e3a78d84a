//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corosio
//

#include <boost/corotls/error.hpp>
#include <boost/capy/error.hpp>

namespace boost::corotls {

namespace {

struct error_cat_type : system::error_category
{
    char const*
    name() const noexcept override
    {
        return "boost.corotls";
    }

    std::string
    message(int ev) const override
    {
        switch(static_cast<error>(ev))
        {
        case error::handshake_eof: return "tls handshake eof";
        case error::handshake_alert: return "tls handshake alert";
        case error::protocol_error: return "tls protocol error";
        case error::write_zero: return "transport wrote zero bytes";
        case error::region_expired: return "borrowed region expired";
        case error::region_mismatch: return "borrowed region mismatch";
        case error::region_not_recorded: return "no borrowed region recorded";
        case error::operation_in_progress: return "operation already in progress";
        case error::engine_buffer_full: return "engine input buffer full";
        case error::reunite_mismatch: return "halves belong to different streams";
        }
        return "unknown corotls error";
    }

    system::error_condition
    default_error_condition(int ev) const noexcept override
    {
        switch(static_cast<error>(ev))
        {
        case error::handshake_eof:
        case error::handshake_alert:
            return condition::unexpected_eof;
        case error::protocol_error:
            return condition::invalid_data;
        default:
            return {ev, *this};
        }
    }
};

struct condition_cat_type : system::error_category
{
    char const*
    name() const noexcept override
    {
        return "boost.corotls.condition";
    }

    std::string
    message(int ev) const override
    {
        switch(static_cast<condition>(ev))
        {
        case condition::unexpected_eof: return "unexpected eof";
        case condition::invalid_data: return "invalid data";
        }
        return "unknown corotls condition";
    }

    bool
    equivalent(
        system::error_code const& ec,
        int cv) const noexcept override
    {
        switch(static_cast<condition>(cv))
        {
        case condition::unexpected_eof:
            return
                ec == error::handshake_eof ||
                ec == error::handshake_alert ||
                ec == capy::error::stream_truncated;

        case condition::invalid_data:
            // engine categories map their codes here
            return
                ec == error::protocol_error ||
                ec.category().default_error_condition(
                    ec.value()) == system::error_condition(cv, *this);
        }
        return false;
    }
};

} // namespace

system::error_category const&
get_error_category() noexcept
{
    static error_cat_type const cat;
    return cat;
}

system::error_category const&
get_condition_category() noexcept
{
    static condition_cat_type const cat;
    return cat;
}

} // namespace boost::corotls
