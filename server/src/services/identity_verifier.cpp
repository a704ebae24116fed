//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/identity_verifier.hpp"

#include <string>

#include "error.hpp"
#include "services/redis_client.hpp"

using namespace lobbychat;
namespace asio = boost::asio;

namespace {

class redis_identity_verifier final : public identity_verifier
{
    redis_client* redis_;

public:
    explicit redis_identity_verifier(redis_client& redis) noexcept : redis_(&redis) {}

    asio::awaitable<result<user_identity>> verify(std::string_view token) final override
    {
        if (token.empty())
            LOBBYCHAT_CO_RETURN_ERROR(errc::unauthorized)

        std::string key = "session:";
        key += token;
        auto res = co_await redis_->get_string_key(key);
        if (res.has_error())
        {
            if (res.error() == errc::not_found)
                LOBBYCHAT_CO_RETURN_ERROR(errc::unauthorized)
            co_return res.error();
        }

        // An empty user ID can't identify anyone
        if (res->empty())
            LOBBYCHAT_CO_RETURN_ERROR(errc::unauthorized)

        co_return std::move(*res);
    }
};

}  // namespace

std::unique_ptr<identity_verifier> lobbychat::create_redis_identity_verifier(redis_client& redis)
{
    return std::unique_ptr<identity_verifier>{new redis_identity_verifier(redis)};
}
