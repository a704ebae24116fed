//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "application.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <exception>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include "error.hpp"
#include "server.hpp"
#include "services/identity_verifier.hpp"
#include "services/mysql_client.hpp"
#include "services/redis_client.hpp"
#include "shared_state.hpp"

namespace asio = boost::asio;
using namespace lobbychat;

struct application::impl
{
    // An event loop, where the application will run. The server is single-
    // threaded, so we set the concurrency hint to 1
    asio::io_context ctx{1};

    // Singleton objects shared by all connections
    std::shared_ptr<shared_state> st;

    // Where we listen. Populated by setup()
    asio::ip::tcp::endpoint local_endpoint;

    impl(server_config config, std::unique_ptr<identity_verifier> verifier)
        : st(std::make_shared<shared_state>(std::move(config), ctx.get_executor(), std::move(verifier)))
    {
    }

    // Stops the reconnection loops and the io_context. Must run within the io_context
    void shutdown()
    {
        if (auto* redis = st->redis())
            redis->cancel();
        if (auto* mysql = st->mysql())
            mysql->cancel();
        ctx.stop();
    }
};

application::application(server_config config, std::unique_ptr<identity_verifier> verifier)
    : impl_(std::make_unique<impl>(std::move(config), std::move(verifier)))
{
}

application::application(application&&) noexcept = default;
application& application::operator=(application&&) noexcept = default;
application::~application() = default;

error_code application::setup()
{
    error_code ec;
    const auto& cfg = impl_->st->config();

    // The physical endpoint where our server will listen
    auto address = asio::ip::make_address(cfg.listen_address, ec);
    if (ec)
    {
        log_error(ec, "Parsing the listening address", cfg.listen_address);
        return ec;
    }

    auto acceptor = create_acceptor(impl_->ctx.get_executor(), {address, cfg.listen_port});
    if (acceptor.has_error())
    {
        log_error(acceptor.error(), "Setting up the listening socket");
        return acceptor.error();
    }
    impl_->local_endpoint = acceptor->local_endpoint();

    // Launch the Redis connection
    if (auto* redis = impl_->st->redis())
        redis->start_run();

    // Launch the MySQL connection pool
    if (auto* mysql = impl_->st->mysql())
        mysql->start_run();

    // Start listening for HTTP connections. This will run until the context is stopped
    asio::co_spawn(
        // The execution context to run the coroutine on
        impl_->ctx,

        // The actual coroutine to run, as an awaitable
        run_server(std::move(acceptor).value(), impl_->st),

        // Will run when the coroutine finishes. Propagate any exceptions thrown
        // in the coroutine to run_until_completion
        [](std::exception_ptr exc) {
            if (exc)
                std::rethrow_exception(exc);
        }
    );

    std::ostringstream oss;
    oss << "Listening on " << impl_->local_endpoint;
    log_info(oss.str());

    return error_code();
}

asio::ip::tcp::endpoint application::local_endpoint() const { return impl_->local_endpoint; }

void application::run_until_completion(bool handle_signals)
{
    // A signal_set allows us to intercept SIGINT and SIGTERM and
    // exit gracefully
    std::optional<asio::signal_set> signals;
    if (handle_signals)
    {
        signals.emplace(impl_->ctx.get_executor(), SIGINT, SIGTERM);
        signals->async_wait([this](boost::system::error_code ec, int) {
            if (ec != asio::error::operation_aborted)
                impl_->shutdown();
        });
    }

    // Run the io_context. This will block until the context is stopped by
    // a signal or by stop()
    impl_->ctx.run();

    log_info("Server stopped");
}

void application::stop()
{
    asio::post(impl_->ctx, [i = impl_.get()] { i->shutdown(); });
}
