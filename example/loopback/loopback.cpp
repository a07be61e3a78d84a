//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corosio
//

#include <boost/corotls.hpp>
#include <boost/corotls/test/duplex.hpp>
#include <boost/capy/task.hpp>
#include <boost/capy/ex/run_async.hpp>
#include <boost/capy/buffers.hpp>
#include <boost/capy/error.hpp>
#include <boost/system/system_error.hpp>

#include <cstdlib>
#include <iostream>
#include <string>

namespace corotls = boost::corotls;
namespace capy = boost::capy;

using duplex_stream = corotls::stream<corotls::test::duplex>;

// Send the message, then close the session
capy::task<void>
run_client(
    corotls::openssl_connector const& connector,
    corotls::test::duplex io,
    std::string message)
{
    auto r = co_await connector.connect("localhost", std::move(io));
    if (r.has_error())
        throw boost::system::system_error(r.error());
    auto& s = *r;

    std::size_t pos = 0;
    while (pos < message.size())
    {
        auto [ec, n] = co_await s.write(capy::const_buffer(
            message.data() + pos, message.size() - pos));
        if (ec)
            throw boost::system::system_error(ec);
        pos += n;
    }

    if (auto [ec] = co_await s.shutdown(); ec)
        throw boost::system::system_error(ec);
}

// Print everything received until the client closes
capy::task<void>
run_server(
    corotls::openssl_acceptor const& acceptor,
    corotls::test::duplex io)
{
    auto r = co_await acceptor.accept(std::move(io));
    if (r.has_error())
        throw boost::system::system_error(r.error());
    auto& s = *r;

    std::string received;
    char buf[1024];
    for (;;)
    {
        auto [ec, n] = co_await s.read(capy::mutable_buffer(buf, sizeof(buf)));
        // close_notify ends the session cleanly
        if (ec == capy::error::eof)
            break;
        if (ec)
            throw boost::system::system_error(ec);
        received.append(buf, n);
    }

    std::cout << "server received: " << received << std::endl;
}

int
main(int argc, char* argv[])
{
    if (argc < 3 || argc > 4)
    {
        std::cerr <<
            "Usage: loopback <cert.pem> <key.pem> [message]\n"
            "Example:\n"
            "    loopback server.pem server.key \"hello over tls\"\n";
        return EXIT_FAILURE;
    }

    std::string message = (argc == 4) ? argv[3] : "hello";

    try
    {
        corotls::tls::context server_ctx;
        server_ctx.use_certificate_chain_file(argv[1]).value();
        server_ctx.use_private_key_file(argv[2]).value();

        // Both ends live in this process; the peer is not verified
        corotls::tls::context client_ctx;
        client_ctx.set_verify_mode(corotls::tls::verify_mode::none);

        corotls::openssl_connector connector(client_ctx);
        corotls::openssl_acceptor acceptor(server_ctx);

        corotls::local_context ctx;
        auto [a, b] = corotls::test::make_duplex_pair(ctx);
        capy::run_async(ctx.get_executor())(
            run_server(acceptor, std::move(b)));
        capy::run_async(ctx.get_executor())(
            run_client(connector, std::move(a), message));
        ctx.run();
    }
    catch(boost::system::system_error const& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
    catch(std::exception const& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
