//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LOBBYCHAT_SERVER_INCLUDE_API_HISTORY_HPP
#define LOBBYCHAT_SERVER_INCLUDE_API_HISTORY_HPP

#include <boost/asio/awaitable.hpp>

#include "request_context.hpp"

namespace lobbychat {

class shared_state;

// GET /api/chat/history?room=R&limit=N&cursor=C
boost::asio::awaitable<response_builder::response_type> handle_room_history(
    request_context& ctx,
    shared_state& st
);

// GET /api/chat/dm-history?peer=P&limit=N&cursor=C
boost::asio::awaitable<response_builder::response_type> handle_dm_history(
    request_context& ctx,
    shared_state& st
);

// GET /api/chat/conversations?limit=N
boost::asio::awaitable<response_builder::response_type> handle_conversations(
    request_context& ctx,
    shared_state& st
);

// GET /api/chat/blocks
boost::asio::awaitable<response_builder::response_type> handle_blocks(request_context& ctx, shared_state& st);

}  // namespace lobbychat

#endif
