//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corosio
//

// Test that header file is self-contained.
#include <boost/corotls/test/duplex.hpp>

#include <boost/corotls/async_stream.hpp>
#include <boost/capy/error.hpp>
#include <boost/capy/ex/run_async.hpp>
#include <boost/capy/task.hpp>
#include <boost/system/errc.hpp>

#include <string>

#include "test_suite.hpp"

namespace boost::corotls::test {

static_assert(AsyncStream<duplex>);

struct duplex_test
{
    void
    testWriteThenRead()
    {
        local_context ctx;
        auto [a, b] = make_duplex_pair(ctx);

        capy::run_async(ctx.get_executor())(
            [](duplex& a, duplex& b) -> capy::task<>
            {
                std::string s = "hello";
                auto [ec, n] = co_await a.write_some(
                    capy::const_buffer(s.data(), s.size()));
                BOOST_TEST(! ec);
                BOOST_TEST_EQ(n, 5u);
                BOOST_TEST_EQ(a.unread(), 5u);

                char buf[16];
                auto [ec2, n2] = co_await b.read_some(
                    capy::mutable_buffer(buf, sizeof(buf)));
                BOOST_TEST(! ec2);
                BOOST_TEST_EQ(std::string(buf, n2), "hello");
                BOOST_TEST_EQ(a.unread(), 0u);
            }(a, b));
        ctx.run();
    }

    void
    testReadWaits()
    {
        local_context ctx;
        auto [a, b] = make_duplex_pair(ctx);
        std::string got;

        capy::run_async(ctx.get_executor())(
            [](duplex& b, std::string& out) -> capy::task<>
            {
                char buf[16];
                auto [ec, n] = co_await b.read_some(
                    capy::mutable_buffer(buf, sizeof(buf)));
                BOOST_TEST(! ec);
                out.assign(buf, n);
            }(b, got));
        capy::run_async(ctx.get_executor())(
            [](duplex& a) -> capy::task<>
            {
                std::string s = "late";
                auto [ec, n] = co_await a.write_some(
                    capy::const_buffer(s.data(), s.size()));
                BOOST_TEST(! ec);
            }(a));
        ctx.run();
        BOOST_TEST_EQ(got, "late");
    }

    void
    testMaxTransfer()
    {
        local_context ctx;
        auto [a, b] = make_duplex_pair(ctx, 3);

        capy::run_async(ctx.get_executor())(
            [](duplex& a, duplex& b) -> capy::task<>
            {
                std::string s = "abcdefg";
                auto [ec, n] = co_await a.write_some(
                    capy::const_buffer(s.data(), s.size()));
                BOOST_TEST_EQ(n, 3u);

                b.set_max_transfer(0);
                auto [ec2, n2] = co_await a.write_some(
                    capy::const_buffer(s.data() + 3, 4));
                BOOST_TEST_EQ(n2, 4u);

                char buf[16];
                auto [ec3, n3] = co_await b.read_some(
                    capy::mutable_buffer(buf, sizeof(buf)));
                BOOST_TEST_EQ(std::string(buf, n3), "abcdefg");
                BOOST_TEST_EQ(a.write_calls(), 2u);
            }(a, b));
        ctx.run();
    }

    void
    testShutdown()
    {
        local_context ctx;
        auto [a, b] = make_duplex_pair(ctx);

        capy::run_async(ctx.get_executor())(
            [](duplex& a, duplex& b) -> capy::task<>
            {
                std::string s = "x";
                co_await a.write_some(capy::const_buffer(s.data(), 1));
                auto [sec] = co_await a.shutdown();
                BOOST_TEST(! sec);

                // Buffered bytes come before end of stream
                char buf[4];
                auto [ec, n] = co_await b.read_some(
                    capy::mutable_buffer(buf, sizeof(buf)));
                BOOST_TEST(! ec);
                BOOST_TEST_EQ(n, 1u);
                auto [ec2, n2] = co_await b.read_some(
                    capy::mutable_buffer(buf, sizeof(buf)));
                BOOST_TEST(ec2 == capy::error::eof);

                auto [ec3, n3] = co_await a.write_some(
                    capy::const_buffer(s.data(), 1));
                BOOST_TEST(ec3 == system::errc::broken_pipe);

                // The other direction stays open
                auto [ec4, n4] = co_await b.write_some(
                    capy::const_buffer(s.data(), 1));
                BOOST_TEST(! ec4);
            }(a, b));
        ctx.run();
    }

    void
    testClose()
    {
        local_context ctx;
        auto [a, b] = make_duplex_pair(ctx);
        b.close();

        capy::run_async(ctx.get_executor())(
            [](duplex& a) -> capy::task<>
            {
                std::string s = "x";
                auto [ec, n] = co_await a.write_some(
                    capy::const_buffer(s.data(), 1));
                BOOST_TEST(ec == system::errc::broken_pipe);

                char buf[4];
                auto [ec2, n2] = co_await a.read_some(
                    capy::mutable_buffer(buf, sizeof(buf)));
                BOOST_TEST(ec2 == capy::error::eof);
            }(a));
        ctx.run();
    }

    void
    testInjectedErrors()
    {
        local_context ctx;
        auto [a, b] = make_duplex_pair(ctx);
        auto const reset = make_error_code(system::errc::connection_reset);

        // A parked reader is completed at once
        system::error_code read_ec;
        capy::run_async(ctx.get_executor())(
            [](duplex& b, system::error_code& out) -> capy::task<>
            {
                char buf[4];
                auto [ec, n] = co_await b.read_some(
                    capy::mutable_buffer(buf, sizeof(buf)));
                out = ec;
            }(b, read_ec));
        ctx.run();
        ctx.restart();
        BOOST_TEST(! read_ec);
        b.fail_next_read(reset);
        ctx.run();
        ctx.restart();
        BOOST_TEST(read_ec == reset);

        a.fail_next_write(reset);
        capy::run_async(ctx.get_executor())(
            [](duplex& a, system::error_code reset) -> capy::task<>
            {
                std::string s = "x";
                auto [ec, n] = co_await a.write_some(
                    capy::const_buffer(s.data(), 1));
                BOOST_TEST(ec == reset);
                BOOST_TEST_EQ(n, 0u);

                // Only the next write fails
                auto [ec2, n2] = co_await a.write_some(
                    capy::const_buffer(s.data(), 1));
                BOOST_TEST(! ec2);
            }(a, reset));
        ctx.run();
    }

    void
    testFlushCount()
    {
        local_context ctx;
        auto [a, b] = make_duplex_pair(ctx);

        capy::run_async(ctx.get_executor())(
            [](duplex& a) -> capy::task<>
            {
                co_await a.flush();
                co_await a.flush();
            }(a));
        ctx.run();
        BOOST_TEST_EQ(a.flush_count(), 2u);
        BOOST_TEST_EQ(b.flush_count(), 0u);
    }

    void
    run()
    {
        testWriteThenRead();
        testReadWaits();
        testMaxTransfer();
        testShutdown();
        testClose();
        testInjectedErrors();
        testFlushCount();
    }
};

TEST_SUITE(duplex_test, "boost.corotls.test.duplex");

} // namespace boost::corotls::test
