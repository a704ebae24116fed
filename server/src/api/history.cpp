//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "api/history.hpp"

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>

#include "api/api_types.hpp"
#include "error.hpp"
#include "request_context.hpp"
#include "services/history_service.hpp"
#include "services/identity_verifier.hpp"
#include "shared_state.hpp"

using namespace lobbychat;
namespace asio = boost::asio;

namespace {

// The parameters shared by both history endpoints
struct page_params
{
    std::optional<std::int64_t> limit;
    std::string cursor;
};

// An absent limit is valid, and lets the service choose
result<std::optional<std::int64_t>> parse_limit(const request_context& ctx)
{
    auto limit = ctx.query_param("limit");
    if (!limit)
        return std::optional<std::int64_t>();

    std::int64_t value{};
    auto parse_res = std::from_chars(limit->data(), limit->data() + limit->size(), value);
    if (parse_res.ec != std::errc() || parse_res.ptr != limit->data() + limit->size())
        LOBBYCHAT_RETURN_ERROR(errc::malformed_command)
    return std::optional<std::int64_t>(value);
}

result<page_params> parse_page_params(const request_context& ctx)
{
    auto limit = parse_limit(ctx);
    if (limit.has_error())
        return limit.error();
    return page_params{*limit, ctx.query_param("cursor").value_or(std::string())};
}

// Resolves the bearer token to an identity
asio::awaitable<result<user_identity>> authenticate(request_context& ctx, shared_state& st)
{
    co_return co_await st.verifier().verify(ctx.bearer_token());
}

response_builder::response_type history_error(request_context& ctx, error_code ec)
{
    if (ec == errc::invalid_cursor)
        return ctx.response().bad_request_json(api_error_id::invalid_cursor, "Invalid cursor");
    return ctx.response().internal_server_error(ec, "Retrieving history");
}

}  // namespace

asio::awaitable<response_builder::response_type> lobbychat::handle_room_history(
    request_context& ctx,
    shared_state& st
)
{
    // Check authentication
    auto identity = co_await authenticate(ctx, st);
    if (identity.has_error())
    {
        if (identity.error() == errc::unauthorized)
            co_return ctx.response().unauthorized_json();
        co_return ctx.response().internal_server_error(identity.error(), "Verifying identity");
    }

    // Parse params
    auto room = ctx.query_param("room");
    if (!room || room->empty())
        co_return ctx.response().bad_request_json("room: required");
    auto params = parse_page_params(ctx);
    if (params.has_error())
        co_return ctx.response().bad_request_json("limit: invalid value");

    // Retrieve the page
    history_service svc(st.history(), st.blocks());
    auto page = co_await svc.room_history(*room, params->limit, params->cursor);
    if (page.has_error())
        co_return history_error(ctx, page.error());
    co_return ctx.response().json_response(history_response{*page});
}

asio::awaitable<response_builder::response_type> lobbychat::handle_dm_history(
    request_context& ctx,
    shared_state& st
)
{
    // Check authentication
    auto identity = co_await authenticate(ctx, st);
    if (identity.has_error())
    {
        if (identity.error() == errc::unauthorized)
            co_return ctx.response().unauthorized_json();
        co_return ctx.response().internal_server_error(identity.error(), "Verifying identity");
    }

    // Parse params
    auto peer = ctx.query_param("peer");
    if (!peer || peer->empty())
        co_return ctx.response().bad_request_json("peer: required");
    auto params = parse_page_params(ctx);
    if (params.has_error())
        co_return ctx.response().bad_request_json("limit: invalid value");

    // Retrieve the page. Empty while either user blocks the other
    history_service svc(st.history(), st.blocks());
    auto page = co_await svc.dm_history(*identity, *peer, params->limit, params->cursor);
    if (page.has_error())
        co_return history_error(ctx, page.error());
    co_return ctx.response().json_response(history_response{*page});
}

asio::awaitable<response_builder::response_type> lobbychat::handle_conversations(
    request_context& ctx,
    shared_state& st
)
{
    // Check authentication
    auto identity = co_await authenticate(ctx, st);
    if (identity.has_error())
    {
        if (identity.error() == errc::unauthorized)
            co_return ctx.response().unauthorized_json();
        co_return ctx.response().internal_server_error(identity.error(), "Verifying identity");
    }

    auto limit = parse_limit(ctx);
    if (limit.has_error())
        co_return ctx.response().bad_request_json("limit: invalid value");

    history_service svc(st.history(), st.blocks());
    auto convs = co_await svc.conversations(*identity, *limit);
    if (convs.has_error())
        co_return ctx.response().internal_server_error(convs.error(), "Listing conversations");
    co_return ctx.response().json_response(conversations_response{*convs});
}

asio::awaitable<response_builder::response_type> lobbychat::handle_blocks(request_context& ctx, shared_state& st)
{
    auto identity = co_await authenticate(ctx, st);
    if (identity.has_error())
    {
        if (identity.error() == errc::unauthorized)
            co_return ctx.response().unauthorized_json();
        co_return ctx.response().internal_server_error(identity.error(), "Verifying identity");
    }

    history_service svc(st.history(), st.blocks());
    auto blocked = co_await svc.blocked_users(*identity);
    if (blocked.has_error())
        co_return ctx.response().internal_server_error(blocked.error(), "Listing blocks");
    co_return ctx.response().json_response(blocks_response{*blocked});
}
