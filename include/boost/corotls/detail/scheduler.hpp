//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corosio
//

#ifndef BOOST_COROTLS_DETAIL_SCHEDULER_HPP
#define BOOST_COROTLS_DETAIL_SCHEDULER_HPP

#include <boost/corotls/detail/config.hpp>
#include <boost/capy/coro.hpp>

#include <cstddef>

namespace boost::corotls::detail {

struct scheduler
{
    virtual ~scheduler() = default;
    virtual void post(capy::coro) = 0;

    /** Notify scheduler of pending work (for executor use).
        When the count reaches zero, the scheduler stops.
    */
    virtual void on_work_started() noexcept = 0;
    virtual void on_work_finished() noexcept = 0;

    virtual bool running_in_this_thread() const noexcept = 0;
    virtual void stop() = 0;
    virtual bool stopped() const noexcept = 0;
    virtual void restart() = 0;
    virtual std::size_t run() = 0;
    virtual std::size_t run_one() = 0;
};

} // namespace boost::corotls::detail

#endif
