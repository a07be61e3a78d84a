//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corosio
//

// Test that header file is self-contained.
#include <boost/corotls/detail/borrowed_buffer.hpp>

#include <boost/corotls/local_context.hpp>
#include <boost/corotls/test/duplex.hpp>
#include <boost/capy/ex/run_async.hpp>
#include <boost/capy/task.hpp>
#include <boost/system/errc.hpp>

#include <cstring>
#include <memory>
#include <string>

#include "test_suite.hpp"

namespace boost::corotls::detail {

namespace {

using io_size = capy::io_result<std::size_t>;

void
send(local_context& ctx, test::duplex& d, std::string s)
{
    capy::run_async(ctx.get_executor())(
        [](test::duplex& d, std::string s) -> capy::task<>
        {
            auto [ec, n] = co_await d.write_some(
                capy::const_buffer(s.data(), s.size()));
            BOOST_TEST(! ec);
            BOOST_TEST_EQ(n, s.size());
        }(d, std::move(s)));
    ctx.run();
    ctx.restart();
}

io_size
fill(local_context& ctx, borrowed_read_buffer& rb, test::duplex& d)
{
    io_size r{};
    capy::run_async(ctx.get_executor())(
        [](borrowed_read_buffer& rb, test::duplex& d, io_size& out) -> capy::task<>
        {
            out = co_await rb.fill(d);
        }(rb, d, r));
    ctx.run();
    ctx.restart();
    return r;
}

io_size
drain(local_context& ctx, borrowed_write_buffer& wb, test::duplex& d)
{
    io_size r{};
    capy::run_async(ctx.get_executor())(
        [](borrowed_write_buffer& wb, test::duplex& d, io_size& out) -> capy::task<>
        {
            out = co_await wb.drain(d);
        }(wb, d, r));
    ctx.run();
    ctx.restart();
    return r;
}

} // namespace

struct borrowed_buffer_test
{
    // Keeps regions alive for the duration of a test
    std::shared_ptr<char> lease_ = std::make_shared<char>();

    tls::region_owner
    owner() const
    {
        return lease_;
    }

    void
    testReadsIntoRegion()
    {
        local_context ctx;
        auto [a, b] = test::make_duplex_pair(ctx);
        borrowed_read_buffer rb;
        BOOST_TEST(rb.state() == borrow_state::waiting_for_caller);

        // Guard bytes on both sides of the region
        char storage[16];
        std::memset(storage, '#', sizeof(storage));
        char* const region = storage + 4;
        capy::mutable_buffer mb(region, 6);

        auto t = rb.read(mb, owner());
        BOOST_TEST(t.state() == transfer::kind::needs_io);
        BOOST_TEST(rb.state() == borrow_state::waiting_for_transport);
        BOOST_TEST(rb.region().data() == region);

        // More bytes are available than the region holds
        send(ctx, b, "abcdefghij");
        auto [ec, n] = fill(ctx, rb, a);
        BOOST_TEST(! ec);
        BOOST_TEST_EQ(n, 6u);
        BOOST_TEST(rb.state() == borrow_state::filled);

        // The transport wrote straight into the region, and only there
        BOOST_TEST(std::memcmp(storage, "####abcdef######", 16) == 0);

        t = rb.read(mb, owner());
        BOOST_TEST(t.state() == transfer::kind::delivered);
        BOOST_TEST_EQ(t.bytes(), 6u);
        BOOST_TEST(rb.state() == borrow_state::waiting_for_caller);

        // The rest arrives through the next region
        t = rb.read(mb, owner());
        BOOST_TEST(t.state() == transfer::kind::needs_io);
        auto [ec2, n2] = fill(ctx, rb, a);
        BOOST_TEST(! ec2);
        BOOST_TEST_EQ(n2, 4u);
        BOOST_TEST(std::memcmp(storage, "####ghijef######", 16) == 0);
    }

    void
    testRegionMismatch()
    {
        local_context ctx;
        auto [a, b] = test::make_duplex_pair(ctx);
        borrowed_read_buffer rb;

        char first[8];
        char second[8];
        rb.read(capy::mutable_buffer(first, 8), owner());
        send(ctx, b, "xyz");
        fill(ctx, rb, a);

        auto t = rb.read(capy::mutable_buffer(second, 8), owner());
        BOOST_TEST(t.state() == transfer::kind::failed);
        BOOST_TEST(t.error() == error::region_mismatch);

        // A region too small for the filled bytes does not match either
        t = rb.read(capy::mutable_buffer(first, 2), owner());
        BOOST_TEST(t.error() == error::region_mismatch);

        // The original region still collects the bytes
        t = rb.read(capy::mutable_buffer(first, 8), owner());
        BOOST_TEST(t.state() == transfer::kind::delivered);
        BOOST_TEST_EQ(t.bytes(), 3u);
    }

    void
    testNotRecorded()
    {
        local_context ctx;
        auto [a, b] = test::make_duplex_pair(ctx);
        borrowed_read_buffer rb;

        send(ctx, b, "data");
        auto [ec, n] = fill(ctx, rb, a);
        BOOST_TEST(ec == error::region_not_recorded);
        BOOST_TEST_EQ(n, 0u);

        // Nothing was taken from the transport
        BOOST_TEST_EQ(b.unread(), 4u);
    }

    void
    testEofIsSticky()
    {
        local_context ctx;
        auto [a, b] = test::make_duplex_pair(ctx);
        borrowed_read_buffer rb;

        char region[8];
        capy::mutable_buffer mb(region, sizeof(region));
        rb.read(mb, owner());
        b.close();

        auto [ec, n] = fill(ctx, rb, a);
        BOOST_TEST(! ec);
        BOOST_TEST_EQ(n, 0u);

        for(int i = 0; i < 3; ++i)
        {
            auto t = rb.read(mb, owner());
            BOOST_TEST(t.state() == transfer::kind::delivered);
            BOOST_TEST_EQ(t.bytes(), 0u);
            BOOST_TEST(rb.state() == borrow_state::filled);
        }

        // A further fill reports the stored result without I/O
        auto [ec2, n2] = fill(ctx, rb, a);
        BOOST_TEST(! ec2);
        BOOST_TEST_EQ(n2, 0u);
    }

    void
    testExpiredOwner()
    {
        local_context ctx;
        auto [a, b] = test::make_duplex_pair(ctx);
        borrowed_read_buffer rb;

        char region[8];
        {
            auto lease = std::make_shared<char>();
            rb.read(capy::mutable_buffer(region, 8),
                tls::region_owner(lease));
        }

        send(ctx, b, "data");
        auto [ec, n] = fill(ctx, rb, a);
        BOOST_TEST(ec == error::region_expired);
        BOOST_TEST_EQ(n, 0u);
        BOOST_TEST(rb.state() == borrow_state::waiting_for_caller);
        BOOST_TEST_EQ(b.unread(), 4u);
    }

    void
    testTransportErrorKeepsRegion()
    {
        local_context ctx;
        auto [a, b] = test::make_duplex_pair(ctx);
        borrowed_read_buffer rb;

        char region[8];
        capy::mutable_buffer mb(region, sizeof(region));
        rb.read(mb, owner());

        auto const reset = make_error_code(system::errc::connection_reset);
        a.fail_next_read(reset);
        auto [ec, n] = fill(ctx, rb, a);
        BOOST_TEST(ec == reset);
        BOOST_TEST(rb.state() == borrow_state::waiting_for_transport);

        send(ctx, b, "ok");
        auto [ec2, n2] = fill(ctx, rb, a);
        BOOST_TEST(! ec2);
        BOOST_TEST_EQ(n2, 2u);
        BOOST_TEST_EQ(rb.read(mb, owner()).bytes(), 2u);
    }

    void
    testWriteFromRegion()
    {
        local_context ctx;
        auto [a, b] = test::make_duplex_pair(ctx, 3);
        borrowed_write_buffer wb;

        char const region[] = "hello";
        capy::const_buffer cb(region, 5);

        auto t = wb.write(cb, owner());
        BOOST_TEST(t.state() == transfer::kind::needs_io);

        auto [ec, n] = drain(ctx, wb, a);
        BOOST_TEST(! ec);
        BOOST_TEST_EQ(n, 3u);
        BOOST_TEST_EQ(a.unread(), 3u);

        t = wb.write(cb, owner());
        BOOST_TEST(t.state() == transfer::kind::delivered);
        BOOST_TEST_EQ(t.bytes(), 3u);

        // The remainder is a new region
        t = wb.write(capy::const_buffer(region + 3, 2), owner());
        BOOST_TEST(t.state() == transfer::kind::needs_io);
        auto [ec2, n2] = drain(ctx, wb, a);
        BOOST_TEST(! ec2);
        BOOST_TEST_EQ(n2, 2u);
        BOOST_TEST_EQ(a.unread(), 5u);
    }

    void
    run()
    {
        testReadsIntoRegion();
        testRegionMismatch();
        testNotRecorded();
        testEofIsSticky();
        testExpiredOwner();
        testTransportErrorKeepsRegion();
        testWriteFromRegion();
    }
};

TEST_SUITE(borrowed_buffer_test, "boost.corotls.detail.borrowed_buffer");

} // namespace boost::corotls::detail
