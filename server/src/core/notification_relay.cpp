//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "core/notification_relay.hpp"

#include <memory>
#include <string>

#include "api/api_types.hpp"
#include "core/session_registry.hpp"

using namespace lobbychat;

std::size_t notification_relay::notify(std::string_view user_id, const notification& evt)
{
    auto targets = sessions_->connections_for(user_id);
    if (targets.empty())
        return 0u;

    auto payload = std::make_shared<const std::string>(notification_event{evt}.to_json());
    std::size_t res = 0;
    for (const auto& conn : targets)
    {
        switch (conn->send({payload, frame_class::system}))
        {
        case enqueue_result::accepted: ++res; break;
        case enqueue_result::slow_consumer: sessions_->close(*conn, close_reason::slow_consumer); break;
        case enqueue_result::dropped: break;
        }
    }
    return res;
}
