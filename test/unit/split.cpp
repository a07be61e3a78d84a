//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corosio
//

// Test that header file is self-contained.
#include <boost/corotls/split.hpp>

#include <boost/corotls/local_context.hpp>
#include <boost/corotls/test/duplex.hpp>
#include <boost/corotls/tls/openssl_engine.hpp>
#include <boost/capy/error.hpp>
#include <boost/capy/ex/run_async.hpp>
#include <boost/capy/task.hpp>
#include <boost/system/errc.hpp>
#include <boost/system/system_error.hpp>

#include "tls/test_utils.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "test_suite.hpp"

namespace boost::corotls {

namespace {

using tls::test::read_exactly;
using tls::test::write_all;

template<class Buffering>
using duplex_stream = stream<test::duplex, Buffering>;

template<class Buffering>
std::pair<duplex_stream<Buffering>, duplex_stream<Buffering>>
connected_pair(local_context& ctx)
{
    auto [a, b] = test::make_duplex_pair(ctx);
    duplex_stream<Buffering> c(std::move(a),
        tls::openssl_engine::create(
            tls::test::make_client_context(),
            tls::role::client,
            tls::test::server_name).value());
    duplex_stream<Buffering> s(std::move(b),
        tls::openssl_engine::create(
            tls::test::make_server_context(),
            tls::role::server).value());

    auto hs = [](duplex_stream<Buffering>& s) -> capy::task<>
    {
        auto [ec, info] = co_await s.handshake();
        BOOST_TEST(! ec);
    };
    capy::run_async(ctx.get_executor())(hs(c));
    capy::run_async(ctx.get_executor())(hs(s));
    ctx.run();
    ctx.restart();
    return {std::move(c), std::move(s)};
}

} // namespace

struct split_test
{
    template<class Buffering>
    void
    testConcurrentHalves()
    {
        local_context ctx;
        auto [c, s] = connected_pair<Buffering>(ctx);
        using stream_type = duplex_stream<Buffering>;
        using read_type = read_half<test::duplex, Buffering>;
        using write_type = write_half<test::duplex, Buffering>;

        auto [rd, wr] = std::move(s).split();
        BOOST_TEST(rd.is_pair_of(wr));
        BOOST_TEST(! wr.is_write_vectored());

        bool read_done = false;

        // The read waits for data while the write half runs
        capy::run_async(ctx.get_executor())(
            [](read_type& rd, bool& done) -> capy::task<>
            {
                auto got = co_await read_exactly(rd, 5);
                BOOST_TEST_EQ(got, "hello");
                done = true;
            }(rd, read_done));
        capy::run_async(ctx.get_executor())(
            [](write_type& wr, bool const& read_done) -> capy::task<>
            {
                BOOST_TEST(! read_done);
                BOOST_TEST(co_await write_all(wr, "ping"));
                auto [ec] = co_await wr.flush();
                BOOST_TEST(! ec);
            }(wr, read_done));
        capy::run_async(ctx.get_executor())(
            [](stream_type& c) -> capy::task<>
            {
                auto got = co_await read_exactly(c, 4);
                BOOST_TEST_EQ(got, "ping");
                BOOST_TEST(co_await write_all(c, "hello"));
            }(c));
        ctx.run();
        BOOST_TEST(read_done);
    }

    void
    testOperationInProgress()
    {
        local_context ctx;
        auto [c, s] = connected_pair<copy_buffering>(ctx);
        using read_type = read_half<test::duplex, copy_buffering>;

        auto [rd, wr] = std::move(s).split();

        capy::run_async(ctx.get_executor())(
            [](read_type& rd) -> capy::task<>
            {
                char buf[8];
                auto [ec, n] = co_await rd.read(
                    capy::mutable_buffer(buf, sizeof(buf)));
                BOOST_TEST(! ec);
                BOOST_TEST_EQ(std::string(buf, n), "x");
            }(rd));
        capy::run_async(ctx.get_executor())(
            [](read_type& rd) -> capy::task<>
            {
                char buf[8];
                auto [ec, n] = co_await rd.read(
                    capy::mutable_buffer(buf, sizeof(buf)));
                BOOST_TEST(ec == error::operation_in_progress);
                BOOST_TEST_EQ(n, 0u);
            }(rd));
        ctx.run();
        ctx.restart();

        // A reunite while the read is pending is a logic error
        BOOST_TEST_THROWS(
            reunite(std::move(rd), std::move(wr)),
            std::logic_error);

        capy::run_async(ctx.get_executor())(
            [](duplex_stream<copy_buffering>& c) -> capy::task<>
            {
                BOOST_TEST(co_await write_all(c, "x"));
            }(c));
        ctx.run();
    }

    void
    testReunite()
    {
        local_context ctx;
        auto [c, s] = connected_pair<copy_buffering>(ctx);
        using stream_type = duplex_stream<copy_buffering>;

        auto [rd, wr] = std::move(s).split();
        auto r = reunite(std::move(rd), std::move(wr));
        BOOST_TEST(r.has_value());
        stream_type s2 = std::move(*r);

        capy::run_async(ctx.get_executor())(
            [](stream_type& c, stream_type& s) -> capy::task<>
            {
                BOOST_TEST(co_await write_all(c, "again"));
                auto got = co_await read_exactly(s, 5);
                BOOST_TEST_EQ(got, "again");
            }(c, s2));
        ctx.run();
    }

    void
    testReuniteMismatch()
    {
        local_context ctx;
        auto [c1, s1] = connected_pair<copy_buffering>(ctx);
        auto [c2, s2] = connected_pair<copy_buffering>(ctx);
        using read_type = read_half<test::duplex, copy_buffering>;

        auto [rd1, wr1] = std::move(s1).split();
        auto [rd2, wr2] = std::move(s2).split();
        BOOST_TEST(! rd1.is_pair_of(wr2));

        auto r = reunite(std::move(rd1), std::move(wr2));
        BOOST_TEST(r.has_error());
        BOOST_TEST_THROWS(r.value(), system::system_error);

        // Both halves come back intact
        auto e = std::move(r).error();
        BOOST_TEST(e.read.is_pair_of(wr1));
        BOOST_TEST(rd2.is_pair_of(e.write));

        capy::run_async(ctx.get_executor())(
            [](duplex_stream<copy_buffering>& c, read_type& rd)
                -> capy::task<>
            {
                BOOST_TEST(co_await write_all(c, "still"));
                auto got = co_await read_exactly(rd, 5);
                BOOST_TEST_EQ(got, "still");
            }(c1, e.read));
        ctx.run();

        BOOST_TEST(reunite(std::move(e.read), std::move(wr1)).has_value());
        BOOST_TEST(reunite(std::move(rd2), std::move(e.write)).has_value());
    }

    void
    testShutdownThroughWriteHalf()
    {
        local_context ctx;
        auto [c, s] = connected_pair<copy_buffering>(ctx);
        using write_type = write_half<test::duplex, copy_buffering>;

        auto [rd, wr] = std::move(s).split();
        capy::run_async(ctx.get_executor())(
            [](write_type& wr, duplex_stream<copy_buffering>& c)
                -> capy::task<>
            {
                auto [ec] = co_await wr.shutdown();
                BOOST_TEST(! ec);

                char buf[8];
                auto [ec2, n2] = co_await c.read(
                    capy::mutable_buffer(buf, sizeof(buf)));
                BOOST_TEST(ec2 == capy::error::eof);
            }(wr, c));
        ctx.run();
    }

    void
    testDetachedHalves()
    {
        local_context ctx;
        using read_type = read_half<test::duplex, copy_buffering>;
        using write_type = write_half<test::duplex, copy_buffering>;

        auto const ebadf = make_error_code(
            system::errc::bad_file_descriptor);

        read_type rd;
        write_type wr;
        BOOST_TEST(! rd.is_pair_of(wr));
        BOOST_TEST(! wr.is_write_vectored());

        capy::run_async(ctx.get_executor())(
            [](read_type& rd, write_type& wr,
                system::error_code ebadf) -> capy::task<>
            {
                char buf[8];
                auto [rec, rn] = co_await rd.read(
                    capy::mutable_buffer(buf, sizeof(buf)));
                BOOST_TEST(rec == ebadf);
                BOOST_TEST_EQ(rn, 0u);

                auto [wec, wn] = co_await wr.write(
                    capy::const_buffer("x", 1));
                BOOST_TEST(wec == ebadf);
                BOOST_TEST_EQ(wn, 0u);

                auto [fec] = co_await wr.flush();
                BOOST_TEST(fec == ebadf);

                auto [sec] = co_await wr.shutdown();
                BOOST_TEST(sec == ebadf);
            }(rd, wr, ebadf));
        ctx.run();
        ctx.restart();

        // Halves moved into a successful reunite are left empty
        auto [c, s] = connected_pair<copy_buffering>(ctx);
        auto [rd2, wr2] = std::move(s).split();
        auto r = reunite(std::move(rd2), std::move(wr2));
        BOOST_TEST(r.has_value());
        BOOST_TEST(! wr2.is_write_vectored());

        capy::run_async(ctx.get_executor())(
            [](read_type& rd, write_type& wr,
                system::error_code ebadf) -> capy::task<>
            {
                char buf[8];
                auto [rec, rn] = co_await rd.read(
                    capy::mutable_buffer(buf, sizeof(buf)));
                BOOST_TEST(rec == ebadf);

                auto [wec, wn] = co_await wr.write(
                    capy::const_buffer("x", 1));
                BOOST_TEST(wec == ebadf);
            }(rd2, wr2, ebadf));
        ctx.run();
    }

    void
    run()
    {
        testConcurrentHalves<copy_buffering>();
        testConcurrentHalves<borrowed_buffering>();
        testOperationInProgress();
        testReunite();
        testReuniteMismatch();
        testShutdownThroughWriteHalf();
        testDetachedHalves();
    }
};

TEST_SUITE(split_test, "boost.corotls.split");

} // namespace boost::corotls
