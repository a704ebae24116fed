//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "api/chat_websocket.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/beast/websocket/error.hpp>
#include <boost/beast/websocket/rfc6455.hpp>
#include <boost/url/parse.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "core/connection.hpp"
#include "core/router.hpp"
#include "error.hpp"
#include "request_context.hpp"
#include "shared_state.hpp"
#include "util/websocket.hpp"

using namespace lobbychat;
namespace asio = boost::asio;
namespace beast = boost::beast;

namespace {

// Close code used when the credential is rejected
constexpr unsigned unauthorized_close_code = 4001;

// The credential may come in the Authorization header or, for browsers
// (which can't set headers on websocket upgrades), as a token query parameter
std::string get_upgrade_token(const websocket::upgrade_request_type& req)
{
    auto header_token = get_bearer_token(req);
    if (!header_token.empty())
        return std::string(header_token);

    auto target = boost::urls::parse_origin_form(req.target());
    if (target.has_error())
        return {};
    auto params = target->params();
    auto it = params.find("token");
    if (it == params.end() || !(*it).has_value)
        return {};
    return std::string((*it).value);
}

struct close_info
{
    unsigned code;
    std::string_view reason;
};

close_info get_close_info(close_reason why) noexcept
{
    switch (why)
    {
    case close_reason::unauthorized: return {unauthorized_close_code, "Unauthorized"};
    case close_reason::slow_consumer: return {beast::websocket::close_code::try_again_later, "SlowConsumer"};
    case close_reason::protocol_abuse: return {beast::websocket::close_code::policy_error, "MalformedCommand"};
    case close_reason::server_error: return {beast::websocket::close_code::internal_error, "InternalError"};
    default: return {beast::websocket::close_code::normal, ""};
    }
}

// A websocket bound to a connection object. The reader feeds frames to the
// router one at a time; the writer drains the connection's outbound queue.
class chat_session
{
    websocket ws_;
    std::shared_ptr<shared_state> st_;
    std::shared_ptr<connection> conn_;

public:
    chat_session(websocket ws, std::shared_ptr<shared_state> st, std::shared_ptr<connection> conn)
        : ws_(std::move(ws)), st_(std::move(st)), conn_(std::move(conn))
    {
    }

    asio::awaitable<error_code> read_loop(std::string token)
    {
        auto& rt = st_->chat_router();
        error_code res;

        // Authenticate eagerly if the upgrade request carried a credential.
        // Otherwise, the first frame must be an auth command
        if (!token.empty())
            co_await rt.authenticate(conn_, std::move(token));

        while (!conn_->is_closed())
        {
            auto msg = co_await ws_.read();
            if (msg.has_error())
            {
                res = msg.error();
                break;
            }
            co_await rt.handle_frame(conn_, *msg);
        }

        // No-op if the server closed the connection
        rt.close(*conn_, close_reason::transport_closed);
        co_return res;
    }

    asio::awaitable<void> write_loop()
    {
        while (true)
        {
            // Flush everything we have. Frames that arrive while we're writing are picked up here, too
            while (auto frame = conn_->next_frame())
            {
                auto ec = co_await ws_.write(*frame->payload, conn_->write_cancellation_slot());
                if (ec)
                {
                    // The client went away, or stopped reading and was dropped as a slow consumer.
                    // No-op in the latter case. Closing the socket releases the reader
                    st_->chat_router().close(*conn_, close_reason::transport_closed);
                    ws_.shutdown();
                    co_return;
                }
            }

            if (conn_->is_closed())
                break;

            // Wait until there is something else to do
            auto ec = co_await conn_->wait_ready();
            if (ec)
                co_return;
        }

        // If the client went away, there is nobody to tell
        if (conn_->reason() == close_reason::transport_closed)
            co_return;

        // If the closing handshake fails, the reader may still be waiting
        auto info = get_close_info(conn_->reason());
        auto ec = co_await ws_.close(info.code, info.reason);
        if (ec)
        {
            if (ec != beast::websocket::error::closed)
                log_error(ec, "Closing websocket");
            ws_.shutdown();
        }
    }
};

}  // namespace

asio::awaitable<error_code> lobbychat::handle_chat_websocket(websocket socket, std::shared_ptr<shared_state> state)
{
    using namespace asio::experimental::awaitable_operators;

    auto token = get_upgrade_token(socket.upgrade_request());
    auto conn = state->chat_router().create_connection(co_await asio::this_coro::executor);
    chat_session session(std::move(socket), std::move(state), std::move(conn));

    // Both loops run until the connection closes
    co_return co_await (session.read_loop(std::move(token)) && session.write_loop());
}
