//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LOBBYCHAT_SERVER_INCLUDE_SERVICES_IDENTITY_VERIFIER_HPP
#define LOBBYCHAT_SERVER_INCLUDE_SERVICES_IDENTITY_VERIFIER_HPP

#include <boost/asio/awaitable.hpp>

#include <memory>
#include <string_view>

#include "business_types.hpp"
#include "error.hpp"

namespace lobbychat {

class redis_client;

// Resolves bearer tokens, issued by the platform's auth service, to user identities
class identity_verifier
{
public:
    virtual ~identity_verifier() {}

    // Returns the identity owning token. Returns errc::unauthorized if the token
    // is empty, unknown or expired. Other errors mean that verification couldn't be performed
    virtual boost::asio::awaitable<result<user_identity>> verify(std::string_view token) = 0;
};

// Tokens are stored in Redis by the auth service, as session:<token> => user ID
std::unique_ptr<identity_verifier> create_redis_identity_verifier(redis_client& redis);

}  // namespace lobbychat

#endif
