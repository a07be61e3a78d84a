//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corosio
//

#include <boost/corotls/local_context.hpp>

#include "src/detail/local_scheduler.hpp"

namespace boost::corotls {

local_context::
local_context()
    : sched_(&make_service<detail::local_scheduler>())
{
}

local_context::
~local_context()
{
    shutdown();
    destroy();
}

} // namespace boost::corotls
