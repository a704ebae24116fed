//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LOBBYCHAT_SERVER_INCLUDE_CONFIG_HPP
#define LOBBYCHAT_SERVER_INCLUDE_CONFIG_HPP

#include <boost/core/span.hpp>

#include <functional>
#include <string>

#include "core/rate_limiter.hpp"
#include "error.hpp"

namespace lobbychat {

// Where chat history and block relationships live
enum class storage_backend
{
    mysql,   // production
    memory,  // single-process deployments and tests. Data is lost on restart
};

struct mysql_config
{
    std::string hostname{"localhost"};
    std::string username{"lobbychat_user"};
    std::string password{"temp_password"};
    std::string database{"lobbychat"};
};

struct server_config
{
    // Where to listen
    std::string listen_address{"0.0.0.0"};
    unsigned short listen_port{8080};

    storage_backend storage{storage_backend::mysql};
    mysql_config mysql;

    // Sessions live in Redis
    std::string redis_host{"localhost"};

    connection_limits limits;

    // Shared secret for POST /api/internal/notify. If empty, the endpoint is disabled
    std::string notify_secret;
};

// Looks up an environment variable. Returns nullptr if it's not set
using env_lookup = std::function<const char*(const char*)>;

// Builds the server configuration from the command line (program name, address and port)
// and the environment. Returns errc::invalid_config if a value can't be parsed.
result<server_config> load_config(boost::span<const char* const> args, const env_lookup& getenv);

// Same, but using the process environment
result<server_config> load_config(boost::span<const char* const> args);

}  // namespace lobbychat

#endif
