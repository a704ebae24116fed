//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LOBBYCHAT_SERVER_INCLUDE_BUSINESS_TYPES_HPP
#define LOBBYCHAT_SERVER_INCLUDE_BUSINESS_TYPES_HPP

#include <boost/variant2/variant.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Types shared by the routing core, the persistence services and the API layer

namespace lobbychat {

// Identifies a user. Resolved from an opaque credential by an identity_verifier
using user_identity = std::string;

// Timestamps are stored and compared with millisecond precision
using timestamp_t = std::chrono::system_clock::time_point;

inline std::int64_t serialize_timestamp(timestamp_t input) noexcept
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(input.time_since_epoch()).count();
}

inline timestamp_t parse_timestamp(std::int64_t input) noexcept
{
    return timestamp_t(std::chrono::milliseconds(input));
}

// The current time, truncated to milliseconds
inline timestamp_t current_timestamp() noexcept
{
    return std::chrono::time_point_cast<std::chrono::milliseconds>(timestamp_t::clock::now());
}

// A message sent to a room
struct room_destination
{
    std::string room;
};

// A direct message
struct dm_destination
{
    user_identity recipient_id;
};

// Exactly one of both
using message_destination = boost::variant2::variant<room_destination, dm_destination>;

struct message
{
    // Assigned by the history store when the message is persisted
    std::int64_t id{};

    // Who sent the message
    user_identity sender_id;

    // Room or recipient
    message_destination destination;

    // The message text, as received
    std::string body;

    // Assigned by the server, non-decreasing within a conversation
    timestamp_t created_at;

    // The room this message was sent to, or nullptr for DMs
    const std::string* room() const noexcept
    {
        auto* dest = boost::variant2::get_if<room_destination>(&destination);
        return dest ? &dest->room : nullptr;
    }

    // The DM recipient, or nullptr for room messages
    const user_identity* recipient_id() const noexcept
    {
        auto* dest = boost::variant2::get_if<dm_destination>(&destination);
        return dest ? &dest->recipient_id : nullptr;
    }
};

// A batch of messages, as returned by the history store.
// Messages are sorted newest first.
struct message_batch
{
    std::vector<message> messages;

    // true if there are older messages that could be loaded
    bool has_more{};
};

// The latest activity in a DM conversation, as seen by one of its participants
struct conversation_summary
{
    // The other participant
    user_identity peer;

    // When the most recent message was sent, in either direction
    timestamp_t last_message_at;
};

// Out-of-band notifications, emitted by other platform services
struct invite_notification
{
    user_identity from_user_id;
    std::string match_id;
};

struct tournament_announce_notification
{
    std::string match_id;
    user_identity p1;
    user_identity p2;
    timestamp_t eta;
};

using notification = boost::variant2::variant<invite_notification, tournament_announce_notification>;

// Message bodies can't exceed this number of code points
constexpr std::size_t max_body_length = 2000;

// Room names can't exceed this number of bytes
constexpr std::size_t max_room_name_length = 64;

// User IDs can't exceed this number of bytes. Matches the storage columns
constexpr std::size_t max_user_id_length = 255;

}  // namespace lobbychat

#endif
