//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corosio
//

#ifndef BOOST_COROTLS_LOCAL_CONTEXT_HPP
#define BOOST_COROTLS_LOCAL_CONTEXT_HPP

#include <boost/corotls/detail/config.hpp>
#include <boost/corotls/detail/scheduler.hpp>
#include <boost/capy/coro.hpp>
#include <boost/capy/ex/execution_context.hpp>

#include <cstddef>

namespace boost::corotls {

/** A single-threaded cooperative execution context.

    Coroutines posted to the context are resumed one at a time,
    in posting order, by the thread calling `run()`. Nothing is
    ever resumed in parallel, which is the scheduling model
    required by the halves of a split @ref stream.

    `run()` returns as soon as the queue is empty, so a context
    never blocks waiting for external events. Transports driven
    by a local context must complete their operations by
    posting the waiting coroutine back to it.

    @par Thread Safety
    Distinct objects: Safe.@n
    Shared objects: Unsafe.
*/
class BOOST_COROTLS_DECL local_context : public capy::execution_context
{
public:
    /** The executor type for this context. */
    class executor_type;

    local_context();
    ~local_context();

    local_context(local_context const&) = delete;
    local_context& operator=(local_context const&) = delete;

    /** Return an executor for this context.

        @return An executor associated with this context.
    */
    executor_type
    get_executor() const noexcept;

    /** Signal the context to stop processing.

        Any queued coroutines remain queued.
    */
    void
    stop()
    {
        sched_->stop();
    }

    bool
    stopped() const noexcept
    {
        return sched_->stopped();
    }

    /** Restart the context after being stopped.

        This function must be called before `run()` can be called
        again after the context stopped.
    */
    void
    restart()
    {
        sched_->restart();
    }

    /** Resume queued coroutines until none remain.

        The context is stopped when there is no more
        outstanding work.

        @return The number of coroutines resumed.
    */
    std::size_t
    run()
    {
        return sched_->run();
    }

    /** Resume at most one queued coroutine.

        @return The number of coroutines resumed (0 or 1).
    */
    std::size_t
    run_one()
    {
        return sched_->run_one();
    }

private:
    detail::scheduler* sched_;
};

//------------------------------------------------------------------------------

/** An executor for dispatching work to a local context.

    Satisfies the `capy::Executor` concept. Two executors
    compare equal if they refer to the same context.
*/
class local_context::executor_type
{
    local_context* ctx_ = nullptr;

public:
    executor_type() = default;

    explicit
    executor_type(local_context& ctx) noexcept
        : ctx_(&ctx)
    {
    }

    local_context&
    context() const noexcept
    {
        return *ctx_;
    }

    /** Check if the current thread is running this executor's context.

        @return `true` if `run()` is being called on this thread.
    */
    bool
    running_in_this_thread() const noexcept
    {
        return ctx_->sched_->running_in_this_thread();
    }

    void
    on_work_started() const noexcept
    {
        ctx_->sched_->on_work_started();
    }

    void
    on_work_finished() const noexcept
    {
        ctx_->sched_->on_work_finished();
    }

    /** Dispatch a coroutine handle.

        If called from within `run()`, returns the handle for
        symmetric transfer. Otherwise posts the handle and
        returns `noop_coroutine`.
    */
    capy::coro
    dispatch(capy::coro h) const
    {
        if (running_in_this_thread())
            return h;
        ctx_->sched_->post(h);
        return std::noop_coroutine();
    }

    /** Post a coroutine for deferred execution.

        The coroutine is resumed during a subsequent call
        to `run()`, after every coroutine posted before it.
    */
    void
    post(capy::coro h) const
    {
        ctx_->sched_->post(h);
    }

    bool
    operator==(executor_type const& other) const noexcept
    {
        return ctx_ == other.ctx_;
    }

    bool
    operator!=(executor_type const& other) const noexcept
    {
        return ctx_ != other.ctx_;
    }
};

//------------------------------------------------------------------------------

inline
local_context::executor_type
local_context::
get_executor() const noexcept
{
    return executor_type(const_cast<local_context&>(*this));
}

} // namespace boost::corotls

#endif
