//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LOBBYCHAT_SERVER_INCLUDE_SERVICES_REDIS_CLIENT_HPP
#define LOBBYCHAT_SERVER_INCLUDE_SERVICES_REDIS_CLIENT_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include <memory>
#include <string>
#include <string_view>

#include "error.hpp"

namespace lobbychat {

// Access to the Redis instance shared with the rest of the platform
class redis_client
{
public:
    virtual ~redis_client() {}

    // Starts the Redis runner task, in detached mode. This must be called once
    // to allow other operations to make progress and keep the reconnection loop
    // running
    virtual void start_run() = 0;

    // Cancels the Redis runner task. To be called at shutdown
    virtual void cancel() = 0;

    // Gets the specified key, as a string.
    // Returns not_found if the key does not exist
    virtual boost::asio::awaitable<result<std::string>> get_string_key(std::string_view key) = 0;
};

std::unique_ptr<redis_client> create_redis_client(boost::asio::any_io_executor ex, std::string host);

}  // namespace lobbychat

#endif
