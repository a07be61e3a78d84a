//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corosio
//

// Test that header file is self-contained.
#include <boost/corotls/local_context.hpp>

#include <boost/capy/ex/run_async.hpp>
#include <boost/capy/task.hpp>

#include <coroutine>
#include <stop_token>
#include <vector>

#include "test_suite.hpp"

namespace boost::corotls {

namespace {

// Suspends once by posting itself back to the executor
struct yield_awaitable
{
    local_context::executor_type ex;

    bool await_ready() const noexcept
    {
        return false;
    }

    template<typename Ex>
    auto await_suspend(
        std::coroutine_handle<> h,
        Ex const&) const -> std::coroutine_handle<>
    {
        ex.post(h);
        return std::noop_coroutine();
    }

    template<typename Ex>
    auto await_suspend(
        std::coroutine_handle<> h,
        Ex const&,
        std::stop_token) const -> std::coroutine_handle<>
    {
        ex.post(h);
        return std::noop_coroutine();
    }

    void await_resume() const noexcept
    {
    }
};

} // namespace

struct local_context_test
{
    void
    testRunEmpty()
    {
        local_context ctx;
        BOOST_TEST_EQ(ctx.run(), 0u);
        BOOST_TEST(ctx.stopped());
        ctx.restart();
        BOOST_TEST(! ctx.stopped());
    }

    void
    testRunsTask()
    {
        local_context ctx;
        int value = 0;
        capy::run_async(ctx.get_executor())(
            [](int& v) -> capy::task<>
            {
                v = 42;
                co_return;
            }(value));
        ctx.run();
        BOOST_TEST_EQ(value, 42);
    }

    void
    testPostOrder()
    {
        local_context ctx;
        std::vector<int> order;
        auto ex = ctx.get_executor();

        auto make = [](std::vector<int>& out, int id,
            local_context::executor_type ex) -> capy::task<>
        {
            out.push_back(id);
            co_await yield_awaitable{ex};
            out.push_back(id + 10);
        };

        capy::run_async(ex)(make(order, 1, ex));
        capy::run_async(ex)(make(order, 2, ex));
        ctx.run();

        BOOST_TEST_EQ(order.size(), 4u);
        if(order.size() == 4)
        {
            BOOST_TEST_EQ(order[0], 1);
            BOOST_TEST_EQ(order[1], 2);
            BOOST_TEST_EQ(order[2], 11);
            BOOST_TEST_EQ(order[3], 12);
        }
    }

    void
    testRunningInThisThread()
    {
        local_context ctx;
        auto ex = ctx.get_executor();
        BOOST_TEST(! ex.running_in_this_thread());

        bool inside = false;
        capy::run_async(ex)(
            [](local_context::executor_type ex, bool& b) -> capy::task<>
            {
                b = ex.running_in_this_thread();
                co_return;
            }(ex, inside));
        ctx.run();
        BOOST_TEST(inside);
    }

    void
    testExecutorEquality()
    {
        local_context a;
        local_context b;
        BOOST_TEST(a.get_executor() == a.get_executor());
        BOOST_TEST(a.get_executor() != b.get_executor());
    }

    void
    run()
    {
        testRunEmpty();
        testRunsTask();
        testPostOrder();
        testRunningInThisThread();
        testExecutorEquality();
    }
};

TEST_SUITE(local_context_test, "boost.corotls.local_context");

} // namespace boost::corotls
