//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "http_session.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancel_after.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/message_generator.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/websocket/error.hpp>
#include <boost/beast/websocket/rfc6455.hpp>
#include <boost/url/parse.hpp>
#include <boost/url/url.hpp>

#include <chrono>
#include <cstddef>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "api/chat_websocket.hpp"
#include "api/history.hpp"
#include "api/notify.hpp"
#include "error.hpp"
#include "request_context.hpp"
#include "shared_state.hpp"
#include "util/websocket.hpp"

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace asio = boost::asio;
using namespace lobbychat;

namespace {

using handler_fn = asio::awaitable<http::message_generator> (*)(request_context&, shared_state&);

struct route
{
    std::string_view path;
    http::verb method;
    handler_fn handler;
};

// Everything served over plain HTTP. Paths are matched after normalization
constexpr route routes[] = {
    {"/api/chat/history",       http::verb::get,  handle_room_history },
    {"/api/chat/dm-history",    http::verb::get,  handle_dm_history   },
    {"/api/chat/conversations", http::verb::get,  handle_conversations},
    {"/api/chat/blocks",        http::verb::get,  handle_blocks       },
    {"/api/internal/notify",    http::verb::post, handle_notify       },
};

// The only target that accepts websocket upgrades
constexpr std::string_view chat_websocket_path = "/ws/chat";

// Requests carry small JSON bodies, at most
constexpr std::size_t max_body_size = 10000;

// Chat frames are small, so anything above this is abuse
constexpr std::size_t max_frame_size = 64u * 1024u;

// Applies both to reading a request and to running its handler
constexpr std::chrono::seconds request_timeout{30};

// The handler for a request, or the status to reply with if there is none
struct route_match
{
    handler_fn handler;
    http::status status;
};

route_match find_route(std::string_view path, http::verb method)
{
    bool path_exists = false;
    for (const auto& r : routes)
    {
        if (r.path != path)
            continue;
        if (r.method == method)
            return {r.handler, http::status::ok};
        path_exists = true;
    }
    return {nullptr, path_exists ? http::status::method_not_allowed : http::status::not_found};
}

// Percent-encoding and dot segments don't change where a request goes
std::string normalized_path(const boost::urls::url_view& target)
{
    boost::urls::url res(target);
    res.normalize();
    return std::string(res.encoded_path());
}

bool is_chat_websocket_target(std::string_view target)
{
    auto url = boost::urls::parse_origin_form(target);
    return url.has_value() && normalized_path(*url) == chat_websocket_path;
}

asio::awaitable<http::message_generator> dispatch(request_context& ctx, shared_state& st)
{
    if (ctx.parse_request_target())
        co_return ctx.response().bad_request_text("Invalid request target");

    auto match = find_route(normalized_path(ctx.request_target()), ctx.request_method());
    if (match.status == http::status::not_found)
        co_return ctx.response().not_found_text();
    if (match.status == http::status::method_not_allowed)
        co_return ctx.response().method_not_allowed();

    // Handlers may access the databases. If the deadline expires, the handler
    // is cancelled and co_spawn throws. co_spawn can't return types that
    // aren't default-constructible, hence the optional
    std::optional<http::message_generator> res;
    co_await asio::co_spawn(
        co_await asio::this_coro::executor,
        [handler = match.handler, &res, &ctx, &st]() -> asio::awaitable<void> {
            res = co_await handler(ctx, st);
        },
        asio::cancel_after(request_timeout)
    );
    co_return std::move(res).value();
}

// Produces a response for a regular HTTP request
asio::awaitable<http::message_generator> serve_request(request_context::request_type&& req, shared_state& st)
{
    request_context ctx(std::move(req));

    // Errors are reported as responses. An exception here is a bug,
    // but shouldn't take the server down
    try
    {
        co_return co_await dispatch(ctx, st);
    }
    catch (const std::exception& err)
    {
        co_return ctx.response().internal_server_error(errc::uncaught_exception, err.what());
    }
}

// Hands the connection over to the chat websocket, which runs until the client goes away
asio::awaitable<void> serve_websocket(
    beast::tcp_stream& stream,
    websocket::upgrade_request_type&& req,
    beast::flat_buffer& buff,
    std::shared_ptr<shared_state> st
)
{
    // The buffer may contain bytes the client sent after the upgrade request
    websocket ws(stream.release_socket(), std::move(req), std::move(buff));
    auto ec = co_await ws.accept(max_frame_size);
    if (ec)
    {
        log_error(ec, "Accepting websocket");
        co_return;
    }

    try
    {
        ec = co_await handle_chat_websocket(std::move(ws), std::move(st));
        if (ec && ec != beast::websocket::error::closed)
            log_error(ec, "Running chat websocket session");
    }
    catch (const std::exception& err)
    {
        log_error(errc::uncaught_exception, "Uncaught exception while running websocket session", err.what());
    }
}

asio::awaitable<error_code> read_request(
    beast::tcp_stream& stream,
    beast::flat_buffer& buff,
    http::request_parser<http::string_body>& parser
)
{
    parser.body_limit(max_body_size);
    stream.expires_after(request_timeout);
    error_code ec;
    co_await http::async_read(stream, buff, parser, asio::redirect_error(ec));
    co_return ec;
}

}  // namespace

asio::awaitable<void> lobbychat::run_http_session(
    boost::asio::ip::tcp::socket&& socket,
    std::shared_ptr<shared_state> state
)
{
    beast::tcp_stream stream(std::move(socket));
    beast::flat_buffer buff;

    while (true)
    {
        // Parsers can't be reused across requests
        http::request_parser<http::string_body> parser;
        auto ec = co_await read_request(stream, buff, parser);
        if (ec == http::error::end_of_stream)
        {
            stream.socket().shutdown(asio::ip::tcp::socket::shutdown_send, ec);
            co_return;
        }
        if (ec)
        {
            // Idle keep-alive connections expire routinely
            if (ec != beast::error::timeout)
                log_error(ec, "Reading HTTP request");
            co_return;
        }

        // Upgrades to any other target are served as plain requests, and get a 404
        if (beast::websocket::is_upgrade(parser.get()) && is_chat_websocket_target(parser.get().target()))
        {
            co_await serve_websocket(stream, parser.release(), buff, std::move(state));
            co_return;
        }

        http::message_generator res = co_await serve_request(parser.release(), *state);
        bool keep_alive = res.keep_alive();
        co_await beast::async_write(stream, std::move(res), asio::redirect_error(ec));
        if (ec)
        {
            log_error(ec, "Writing HTTP response");
            co_return;
        }

        if (!keep_alive)
        {
            stream.socket().shutdown(asio::ip::tcp::socket::shutdown_send, ec);
            co_return;
        }
    }
}
