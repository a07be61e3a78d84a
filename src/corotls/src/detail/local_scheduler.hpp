//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corosio
//

#ifndef BOOST_COROTLS_DETAIL_LOCAL_SCHEDULER_HPP
#define BOOST_COROTLS_DETAIL_LOCAL_SCHEDULER_HPP

#include <boost/corotls/detail/config.hpp>
#include <boost/corotls/detail/scheduler.hpp>
#include <boost/capy/ex/execution_context.hpp>

#include <cstddef>
#include <deque>

namespace boost::corotls::detail {

/** Single-threaded scheduler with a FIFO ready queue.

    Follows the work counting of the reactor schedulers: every
    post counts as outstanding work until the posted coroutine
    has been resumed, and executors add their own work through
    `on_work_started`. The scheduler stops once the count drops
    to zero.

    @par Thread Safety
    Only the thread calling `run()` may use the scheduler.
*/
class local_scheduler
    : public scheduler
    , public capy::execution_context::service
{
public:
    using key_type = scheduler;

    explicit
    local_scheduler(capy::execution_context& ctx);

    ~local_scheduler();

    local_scheduler(local_scheduler const&) = delete;
    local_scheduler& operator=(local_scheduler const&) = delete;

    void shutdown() override;
    void post(capy::coro h) override;
    void on_work_started() noexcept override;
    void on_work_finished() noexcept override;
    bool running_in_this_thread() const noexcept override;
    void stop() override;
    bool stopped() const noexcept override;
    void restart() override;
    std::size_t run() override;
    std::size_t run_one() override;

private:
    std::size_t do_one();
    void work_finished() noexcept;

    std::deque<capy::coro> ready_;
    long outstanding_work_ = 0;
    bool stopped_ = false;
    bool shutdown_ = false;
};

} // namespace boost::corotls::detail

#endif
