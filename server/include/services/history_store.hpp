//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LOBBYCHAT_SERVER_INCLUDE_SERVICES_HISTORY_STORE_HPP
#define LOBBYCHAT_SERVER_INCLUDE_SERVICES_HISTORY_STORE_HPP

#include <boost/asio/awaitable.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"

namespace lobbychat {

// A position in a conversation's history. Reads starting at a cursor
// return messages strictly older than it, by (created_at, id)
struct history_cursor
{
    std::int64_t created_at;  // milliseconds since the epoch
    std::int64_t id;
};

// The cursor pointing just after msg
inline history_cursor cursor_for(const message& msg) noexcept
{
    return {serialize_timestamp(msg.created_at), msg.id};
}

// Cursors travel as "<created_at>-<id>" strings, the same shape as Redis stream IDs
std::string format_cursor(history_cursor c);
result<history_cursor> parse_cursor(std::string_view from);

// Limits for history reads
constexpr std::size_t default_history_limit = 50;
constexpr std::size_t max_history_limit = 100;

// Clamps a client-provided limit to [1, max_history_limit]
inline std::size_t clamp_history_limit(std::optional<std::int64_t> limit) noexcept
{
    if (!limit)
        return default_history_limit;
    if (*limit < 1)
        return 1;
    if (*limit > static_cast<std::int64_t>(max_history_limit))
        return max_history_limit;
    return static_cast<std::size_t>(*limit);
}

// Limits for conversation listings
constexpr std::size_t default_conversation_limit = 20;
constexpr std::size_t max_conversation_limit = 100;

// Append-only message log. Reads return messages newest first.
// Using an interface to reduce build times and improve testability
class history_store
{
public:
    virtual ~history_store() {}

    // Persists a message and returns the ID assigned to it.
    // msg.id is ignored. IDs increase with every append
    virtual boost::asio::awaitable<result<std::int64_t>> append(const message& msg) = 0;

    // Retrieves up to limit messages sent to a room, older than cursor if provided
    virtual boost::asio::awaitable<result<message_batch>> query_room(
        std::string_view room,
        std::size_t limit,
        std::optional<history_cursor> cursor
    ) = 0;

    // Retrieves up to limit DMs exchanged between user_a and user_b (in any direction)
    virtual boost::asio::awaitable<result<message_batch>> query_dm(
        std::string_view user_a,
        std::string_view user_b,
        std::size_t limit,
        std::optional<history_cursor> cursor
    ) = 0;

    // Users that exchanged DMs with user, ordered by their latest message, newest first
    virtual boost::asio::awaitable<result<std::vector<conversation_summary>>> list_conversations(
        std::string_view user,
        std::size_t limit
    ) = 0;
};

// Keeps everything in memory
std::unique_ptr<history_store> create_memory_history_store();

}  // namespace lobbychat

#endif
