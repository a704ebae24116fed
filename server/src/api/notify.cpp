//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "api/notify.hpp"

#include <openssl/crypto.h>

#include <string_view>

#include "api/api_types.hpp"
#include "core/notification_relay.hpp"
#include "request_context.hpp"
#include "shared_state.hpp"

using namespace lobbychat;
namespace asio = boost::asio;

// Compares two secrets, in a way that prevents timing attacks
static bool secrets_equal(std::string_view lhs, std::string_view rhs) noexcept
{
    return lhs.size() == rhs.size() && CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

asio::awaitable<response_builder::response_type> lobbychat::handle_notify(request_context& ctx, shared_state& st)
{
    // Disabled unless configured
    const auto& secret = st.config().notify_secret;
    if (secret.empty())
        co_return ctx.response().not_found_text();

    // Check the caller
    if (!secrets_equal(ctx.bearer_token(), secret))
        co_return ctx.response().unauthorized_json();

    // Parse params
    auto req = ctx.parse_json_body<notify_request>();
    if (req.has_error())
        co_return ctx.response().bad_request_json("Invalid body provided");

    // Deliver
    auto delivered = st.notifications().notify(req->user_id, req->event);
    co_return ctx.response().json_response(notify_response{delivered});
}
