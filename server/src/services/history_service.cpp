//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/history_service.hpp"

#include <utility>

#include "services/block_registry.hpp"
#include "services/history_store.hpp"

using namespace lobbychat;
namespace asio = boost::asio;

static result<std::optional<history_cursor>> parse_optional_cursor(std::string_view cursor)
{
    if (cursor.empty())
        return std::optional<history_cursor>();
    auto res = parse_cursor(cursor);
    if (res.has_error())
        return res.error();
    return std::optional<history_cursor>(*res);
}

static std::size_t clamp_conversation_limit(std::optional<std::int64_t> limit) noexcept
{
    if (!limit)
        return default_conversation_limit;
    if (*limit < 1)
        return 1;
    if (*limit > static_cast<std::int64_t>(max_conversation_limit))
        return max_conversation_limit;
    return static_cast<std::size_t>(*limit);
}

static history_page to_page(message_batch&& batch)
{
    history_page res;
    if (batch.has_more && !batch.messages.empty())
        res.next_cursor = format_cursor(cursor_for(batch.messages.back()));
    res.messages = std::move(batch.messages);
    return res;
}

asio::awaitable<result<history_page>> history_service::room_history(
    std::string_view room,
    std::optional<std::int64_t> limit,
    std::string_view cursor
)
{
    auto parsed_cursor = parse_optional_cursor(cursor);
    if (parsed_cursor.has_error())
        co_return parsed_cursor.error();

    auto batch = co_await store_->query_room(room, clamp_history_limit(limit), *parsed_cursor);
    if (batch.has_error())
        co_return batch.error();
    co_return to_page(std::move(*batch));
}

asio::awaitable<result<history_page>> history_service::dm_history(
    std::string_view viewer,
    std::string_view peer,
    std::optional<std::int64_t> limit,
    std::string_view cursor
)
{
    auto parsed_cursor = parse_optional_cursor(cursor);
    if (parsed_cursor.has_error())
        co_return parsed_cursor.error();

    // Blocks hide the conversation, but never delete it
    auto blocked = co_await blocks_->is_blocked(viewer, peer);
    if (blocked.has_error())
        co_return blocked.error();
    if (*blocked)
        co_return history_page{};

    auto batch = co_await store_->query_dm(viewer, peer, clamp_history_limit(limit), *parsed_cursor);
    if (batch.has_error())
        co_return batch.error();
    co_return to_page(std::move(*batch));
}

asio::awaitable<result<std::vector<conversation_summary>>> history_service::conversations(
    std::string_view viewer,
    std::optional<std::int64_t> limit
)
{
    auto convs = co_await store_->list_conversations(viewer, clamp_conversation_limit(limit));
    if (convs.has_error())
        co_return convs.error();

    // Same rule as dm_history: blocked conversations are hidden
    std::vector<conversation_summary> res;
    for (auto& conv : *convs)
    {
        auto blocked = co_await blocks_->is_blocked(viewer, conv.peer);
        if (blocked.has_error())
            co_return blocked.error();
        if (!*blocked)
            res.push_back(std::move(conv));
    }
    co_return res;
}

asio::awaitable<result<std::vector<user_identity>>> history_service::blocked_users(std::string_view viewer)
{
    co_return co_await blocks_->list_blocked(viewer);
}
