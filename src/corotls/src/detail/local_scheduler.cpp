//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corosio
//

#include "src/detail/local_scheduler.hpp"

#include <boost/corotls/detail/thread_local_ptr.hpp>

#include <limits>

namespace boost::corotls::detail {

namespace {

struct scheduler_context
{
    local_scheduler const* key;
    scheduler_context* next;
};

corotls::detail::thread_local_ptr<scheduler_context> context_stack;

struct thread_context_guard
{
    scheduler_context frame_;

    explicit thread_context_guard(
        local_scheduler const* ctx) noexcept
        : frame_{ctx, context_stack.get()}
    {
        context_stack.set(&frame_);
    }

    ~thread_context_guard() noexcept
    {
        context_stack.set(frame_.next);
    }
};

} // namespace

local_scheduler::
local_scheduler(capy::execution_context&)
{
}

local_scheduler::
~local_scheduler() = default;

void
local_scheduler::
shutdown()
{
    // Queued handles belong to frames owned elsewhere;
    // they are released without being resumed.
    shutdown_ = true;
    ready_.clear();
    outstanding_work_ = 0;
}

void
local_scheduler::
post(capy::coro h)
{
    if (shutdown_)
        return;
    ++outstanding_work_;
    ready_.push_back(h);
}

void
local_scheduler::
on_work_started() noexcept
{
    ++outstanding_work_;
}

void
local_scheduler::
on_work_finished() noexcept
{
    if (--outstanding_work_ == 0)
        stop();
}

void
local_scheduler::
work_finished() noexcept
{
    --outstanding_work_;
}

bool
local_scheduler::
running_in_this_thread() const noexcept
{
    for (auto* c = context_stack.get(); c != nullptr; c = c->next)
        if (c->key == this)
            return true;
    return false;
}

void
local_scheduler::
stop()
{
    stopped_ = true;
}

bool
local_scheduler::
stopped() const noexcept
{
    return stopped_;
}

void
local_scheduler::
restart()
{
    stopped_ = false;
}

std::size_t
local_scheduler::
run()
{
    if (stopped_)
        return 0;

    if (outstanding_work_ == 0)
    {
        stop();
        return 0;
    }

    thread_context_guard ctx(this);

    std::size_t n = 0;
    while (do_one())
        if (n != (std::numeric_limits<std::size_t>::max)())
            ++n;
    return n;
}

std::size_t
local_scheduler::
run_one()
{
    if (stopped_)
        return 0;

    if (outstanding_work_ == 0)
    {
        stop();
        return 0;
    }

    thread_context_guard ctx(this);
    return do_one();
}

std::size_t
local_scheduler::
do_one()
{
    if (stopped_ || ready_.empty())
        return 0;

    auto h = ready_.front();
    ready_.pop_front();

    struct work_guard
    {
        local_scheduler* self;
        ~work_guard() { self->work_finished(); }
    };

    work_guard g{this};
    h.resume();
    return 1;
}

} // namespace boost::corotls::detail
