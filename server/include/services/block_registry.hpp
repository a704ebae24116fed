//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LOBBYCHAT_SERVER_INCLUDE_SERVICES_BLOCK_REGISTRY_HPP
#define LOBBYCHAT_SERVER_INCLUDE_SERVICES_BLOCK_REGISTRY_HPP

#include <boost/asio/awaitable.hpp>

#include <memory>
#include <string_view>
#include <vector>

#include "business_types.hpp"

#include "error.hpp"

namespace lobbychat {

// Stores directed block relationships (blocker, blocked).
// Enforcement is symmetric: a pair is blocked if either user blocked the other.
class block_registry
{
public:
    virtual ~block_registry() {}

    // true if a blocked b, or b blocked a
    virtual boost::asio::awaitable<result<bool>> is_blocked(std::string_view a, std::string_view b) = 0;

    // Records that blocker blocked blocked. Idempotent
    virtual boost::asio::awaitable<error_code> add(std::string_view blocker, std::string_view blocked) = 0;

    // Removes the (blocker, blocked) relationship. Idempotent.
    // Doesn't affect a (blocked, blocker) relationship, if any
    virtual boost::asio::awaitable<error_code> remove(std::string_view blocker, std::string_view blocked) = 0;

    // Users blocked by blocker, sorted. Doesn't include users who blocked blocker
    virtual boost::asio::awaitable<result<std::vector<user_identity>>> list_blocked(std::string_view blocker) = 0;
};

std::unique_ptr<block_registry> create_memory_block_registry();

}  // namespace lobbychat

#endif
