//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LOBBYCHAT_SERVER_INCLUDE_API_CHAT_WEBSOCKET_HPP
#define LOBBYCHAT_SERVER_INCLUDE_API_CHAT_WEBSOCKET_HPP

#include <boost/asio/awaitable.hpp>

#include <memory>

#include "error.hpp"
#include "util/websocket.hpp"

namespace lobbychat {

class shared_state;

// Runs a chat session over an accepted websocket, until the client
// goes away or the server closes the connection.
// Returns the error that terminated the read side, if any
boost::asio::awaitable<error_code> handle_chat_websocket(websocket socket, std::shared_ptr<shared_state> state);

}  // namespace lobbychat

#endif
