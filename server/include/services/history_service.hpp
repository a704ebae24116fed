//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LOBBYCHAT_SERVER_INCLUDE_SERVICES_HISTORY_SERVICE_HPP
#define LOBBYCHAT_SERVER_INCLUDE_SERVICES_HISTORY_SERVICE_HPP

#include <boost/asio/awaitable.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"

namespace lobbychat {

class history_store;
class block_registry;

// A page of history, as served to clients
struct history_page
{
    // Newest first
    std::vector<message> messages;

    // Pass this to get the next (older) page. Empty if there are no more messages
    std::optional<std::string> next_cursor;
};

// The read side of the chat history. Parses cursors, clamps limits
// and applies block filtering to DM history.
class history_service
{
    history_store* store_;
    block_registry* blocks_;

public:
    history_service(history_store& store, block_registry& blocks) noexcept : store_(&store), blocks_(&blocks) {}

    // Retrieves a page of a room's history. An empty cursor means "from the latest".
    // Returns errc::invalid_cursor if the cursor is malformed.
    // Room history is not filtered by blocks
    boost::asio::awaitable<result<history_page>> room_history(
        std::string_view room,
        std::optional<std::int64_t> limit,
        std::string_view cursor
    );

    // Same, for the DMs between viewer and peer. Returns an empty page
    // while either of them blocks the other
    boost::asio::awaitable<result<history_page>> dm_history(
        std::string_view viewer,
        std::string_view peer,
        std::optional<std::int64_t> limit,
        std::string_view cursor
    );

    // The viewer's DM conversations, newest first. Conversations hidden
    // by a block are left out, so fewer than limit may be returned
    boost::asio::awaitable<result<std::vector<conversation_summary>>> conversations(
        std::string_view viewer,
        std::optional<std::int64_t> limit
    );

    // Users the viewer has blocked, sorted
    boost::asio::awaitable<result<std::vector<user_identity>>> blocked_users(std::string_view viewer);
};

}  // namespace lobbychat

#endif
