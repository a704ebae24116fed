//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LOBBYCHAT_SERVER_INCLUDE_SERVICES_MYSQL_CLIENT_HPP
#define LOBBYCHAT_SERVER_INCLUDE_SERVICES_MYSQL_CLIENT_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include <memory>

#include "error.hpp"

namespace lobbychat {

struct mysql_config;
class history_store;
class block_registry;

// Owns the MySQL connection pool and the persistence services backed by it
class mysql_client
{
public:
    virtual ~mysql_client() {}

    // Starts the MySQL connection pool task, in detached mode. This must be called once
    // to allow other operations to make progress and keep the reconnection loop
    // running
    virtual void start_run() = 0;

    // Cancels the MySQL connection pool task. To be called at shutdown
    virtual void cancel() = 0;

    // Creates the tables we need, if they don't exist
    virtual boost::asio::awaitable<error_code> setup_db() = 0;

    // Services sharing this client's pool. The client must outlive them
    virtual std::unique_ptr<history_store> create_history_store() = 0;
    virtual std::unique_ptr<block_registry> create_block_registry() = 0;
};

std::unique_ptr<mysql_client> create_mysql_client(boost::asio::any_io_executor ex, const mysql_config& cfg);

}  // namespace lobbychat

#endif
