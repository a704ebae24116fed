//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LOBBYCHAT_SERVER_INCLUDE_SERVER_HPP
#define LOBBYCHAT_SERVER_INCLUDE_SERVER_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <memory>

#include "error.hpp"

namespace lobbychat {

class shared_state;

// Opens an acceptor listening on endpoint. Port 0 picks an ephemeral port
result<boost::asio::ip::tcp::acceptor> create_acceptor(
    boost::asio::any_io_executor ex,
    boost::asio::ip::tcp::endpoint endpoint
);

// Prepares the database, if any, then accepts connections
// until the acceptor is closed or the io_context is stopped
boost::asio::awaitable<void> run_server(
    boost::asio::ip::tcp::acceptor acceptor,
    std::shared_ptr<shared_state> state
);

}  // namespace lobbychat

#endif
