//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corosio
//

#include <boost/corotls/test/duplex.hpp>
#include <boost/capy/error.hpp>
#include <boost/system/errc.hpp>

#include <algorithm>
#include <cstring>
#include <string>

namespace boost::corotls::test {

namespace {

// Bytes travelling in one direction
struct channel
{
    std::string data;
    std::size_t pos = 0;
    bool shut = false;

    // Reader parked for want of data
    std::coroutine_handle<> waiter;
    capy::mutable_buffer dest;
    system::error_code* ec_out = nullptr;
    std::size_t* n_out = nullptr;

    std::size_t
    available() const noexcept
    {
        return data.size() - pos;
    }

    std::size_t
    take(capy::mutable_buffer buf, std::size_t limit)
    {
        std::size_t n = (std::min)(available(), buf.size());
        if(limit != 0)
            n = (std::min)(n, limit);
        std::memcpy(buf.data(), data.data() + pos, n);
        pos += n;
        if(pos == data.size())
        {
            data.clear();
            pos = 0;
        }
        return n;
    }
};

} // namespace

struct duplex::state
{
    local_context& ctx;
    std::size_t max_transfer;

    // out[i] carries the bytes written by side i
    channel out[2];

    system::error_code read_error[2];
    system::error_code write_error[2];
    bool closed[2] = {false, false};
    std::size_t flushes[2] = {0, 0};
    std::size_t writes[2] = {0, 0};

    state(local_context& c, std::size_t max) noexcept
        : ctx(c)
        , max_transfer(max)
    {
    }

    // Complete the reader parked on `p`, if it can make progress.
    void
    wake(channel& p, system::error_code ec = {})
    {
        if(! p.waiter)
            return;

        std::size_t n = 0;
        if(! ec)
        {
            if(p.available() > 0)
                n = p.take(p.dest, max_transfer);
            else if(p.shut)
                ec = capy::error::eof;
            else
                return;
        }

        *p.ec_out = ec;
        *p.n_out = n;
        auto h = std::exchange(p.waiter, nullptr);
        ctx.get_executor().post(h);
    }
};

//------------------------------------------------------------------------------

duplex::
duplex(std::shared_ptr<state> st, int side) noexcept
    : st_(std::move(st))
    , side_(side)
{
}

duplex::
~duplex() = default;

bool
duplex::
try_read(
    capy::mutable_buffer buf,
    system::error_code& ec,
    std::size_t& n)
{
    auto& st = *st_;
    if(st.read_error[side_])
    {
        ec = std::exchange(st.read_error[side_], {});
        n = 0;
        return true;
    }

    auto& p = st.out[1 - side_];
    if(buf.size() == 0)
    {
        n = 0;
        return true;
    }
    if(p.available() > 0)
    {
        n = p.take(buf, st.max_transfer);
        return true;
    }
    if(p.shut)
    {
        ec = capy::error::eof;
        n = 0;
        return true;
    }
    return false;
}

void
duplex::
park_read(
    std::coroutine_handle<> h,
    capy::mutable_buffer buf,
    system::error_code* ec,
    std::size_t* n)
{
    auto& p = st_->out[1 - side_];
    p.waiter = h;
    p.dest = buf;
    p.ec_out = ec;
    p.n_out = n;
}

void
duplex::
do_write(
    capy::const_buffer buf,
    system::error_code& ec,
    std::size_t& n)
{
    auto& st = *st_;
    ++st.writes[side_];
    n = 0;

    if(st.write_error[side_])
    {
        ec = std::exchange(st.write_error[side_], {});
        return;
    }

    auto& p = st.out[side_];
    if(p.shut || st.closed[1 - side_])
    {
        ec = make_error_code(system::errc::broken_pipe);
        return;
    }

    n = buf.size();
    if(st.max_transfer != 0)
        n = (std::min)(n, st.max_transfer);
    p.data.append(static_cast<char const*>(buf.data()), n);
    st.wake(p);
}

void
duplex::
do_flush() noexcept
{
    ++st_->flushes[side_];
}

duplex::ready_awaitable
duplex::
shutdown()
{
    auto& p = st_->out[side_];
    p.shut = true;
    st_->wake(p);
    return {};
}

void
duplex::
close()
{
    st_->closed[side_] = true;
    auto& p = st_->out[side_];
    p.shut = true;
    st_->wake(p);
}

void
duplex::
fail_next_read(system::error_code ec)
{
    auto& p = st_->out[1 - side_];
    if(p.waiter)
    {
        st_->wake(p, ec);
        return;
    }
    st_->read_error[side_] = ec;
}

void
duplex::
fail_next_write(system::error_code ec)
{
    st_->write_error[side_] = ec;
}

void
duplex::
set_max_transfer(std::size_t n) noexcept
{
    st_->max_transfer = n;
}

std::size_t
duplex::
unread() const noexcept
{
    return st_->out[side_].available();
}

std::size_t
duplex::
flush_count() const noexcept
{
    return st_->flushes[side_];
}

std::size_t
duplex::
write_calls() const noexcept
{
    return st_->writes[side_];
}

//------------------------------------------------------------------------------

std::pair<duplex, duplex>
make_duplex_pair(local_context& ctx, std::size_t max_transfer)
{
    auto st = std::make_shared<duplex::state>(ctx, max_transfer);
    return {duplex(st, 0), duplex(st, 1)};
}

} // namespace boost::corotls::test
