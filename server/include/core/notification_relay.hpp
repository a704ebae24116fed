//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LOBBYCHAT_SERVER_INCLUDE_CORE_NOTIFICATION_RELAY_HPP
#define LOBBYCHAT_SERVER_INCLUDE_CORE_NOTIFICATION_RELAY_HPP

#include <cstddef>
#include <string_view>

#include "business_types.hpp"

namespace lobbychat {

class session_registry;

// Injects events originated by other platform services (match invites,
// tournament announcements) into the outbound path of a user's connections.
// Notifications bypass inbound rate limiting, and are never evicted by presence traffic.
class notification_relay
{
    session_registry* sessions_;

public:
    explicit notification_relay(session_registry& sessions) noexcept : sessions_(&sessions) {}

    // Delivers evt to every live connection of user_id. Returns the number of
    // connections it was queued to. Users without live connections get nothing.
    std::size_t notify(std::string_view user_id, const notification& evt);
};

}  // namespace lobbychat

#endif
