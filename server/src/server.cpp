//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "server.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/system/system_error.hpp>

#include <exception>
#include <memory>

#include "error.hpp"
#include "http_session.hpp"
#include "services/mysql_client.hpp"
#include "shared_state.hpp"

namespace asio = boost::asio;
using namespace lobbychat;

static void log_exception(std::exception_ptr ptr)
{
    try
    {
        // Rethrowing is the only way to access the underlying exception object
        std::rethrow_exception(ptr);
    }
    catch (const std::exception& exc)
    {
        log_error(errc::uncaught_exception, "Uncaught exception in HTTP session handler", exc.what());
    }
}

result<asio::ip::tcp::acceptor> lobbychat::create_acceptor(
    asio::any_io_executor ex,
    asio::ip::tcp::endpoint endpoint
)
{
    error_code ec;
    asio::ip::tcp::acceptor acceptor(std::move(ex));

    // Set up the acceptor to listen in the requested endpoint and allow
    // address reuse.
    acceptor.open(endpoint.protocol(), ec);
    if (ec)
        return ec;
    acceptor.set_option(asio::socket_base::reuse_address(true), ec);
    if (ec)
        return ec;
    acceptor.bind(endpoint, ec);
    if (ec)
        return ec;
    acceptor.listen(asio::socket_base::max_listen_connections, ec);
    if (ec)
        return ec;

    return acceptor;
}

asio::awaitable<void> lobbychat::run_server(asio::ip::tcp::acceptor acceptor, std::shared_ptr<shared_state> st)
{
    // Get the executor associated to the current coroutine
    auto ex = co_await asio::this_coro::executor;

    // Create the schema. If this fails, we can't serve anything, so we throw.
    // The exception reaches the io_context and brings the server down
    if (auto* mysql = st->mysql())
    {
        auto ec = co_await mysql->setup_db();
        if (ec)
            throw boost::system::system_error(ec, "Setting up the database");
    }

    // We accept connections in a loop. When the io_context is stopped,
    // the coroutine will no longer be scheduled, effectively ending the loop
    while (true)
    {
        auto [ec, sock] = co_await acceptor.async_accept(asio::as_tuple);
        if (ec == asio::error::operation_aborted)
            co_return;
        if (ec)
        {
            // Errors like running out of file descriptors are transient
            log_error(ec, "Accepting connection");
            continue;
        }

        // Launch a new session for this connection. Each session gets its
        // own coroutine, so we can get back to listening for new connections.
        asio::co_spawn(
            // Use the same executor as the current coroutine
            ex,

            // The function to run
            run_http_session(std::move(sock), st),

            // If an exception was thrown in a session, log it but don't propagate it.
            // This way, an unhandled error in a session affects only this session,
            // rather than bringing the entire server down
            [](std::exception_ptr exc) {
                if (exc)
                    log_exception(exc);
            }
        );
    }
}
