//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LOBBYCHAT_SERVER_INCLUDE_API_NOTIFY_HPP
#define LOBBYCHAT_SERVER_INCLUDE_API_NOTIFY_HPP

#include <boost/asio/awaitable.hpp>

#include "request_context.hpp"

namespace lobbychat {

class shared_state;

// POST /api/internal/notify. Used by other platform services (matchmaking,
// tournaments) to push events to connected users. Requires the shared secret
// as bearer token, and answers 404 if no secret is configured.
boost::asio::awaitable<response_builder::response_type> handle_notify(request_context& ctx, shared_state& st);

}  // namespace lobbychat

#endif
