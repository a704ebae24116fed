//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LOBBYCHAT_SERVER_INCLUDE_API_API_TYPES_HPP
#define LOBBYCHAT_SERVER_INCLUDE_API_API_TYPES_HPP

#include <boost/core/span.hpp>
#include <boost/variant2/variant.hpp>

#include <cstddef>
#include <string>
#include <string_view>

#include "business_types.hpp"
#include "error.hpp"

// Types defining the API. Contains structs for the websocket frames
// and the HTTP request and response bodies, together with
// their (de)serialization functions.

namespace lobbychat {

struct history_page;

//
// Websocket API: client to server frames
//

// Authenticates a connection that didn't provide a credential in the upgrade request
struct auth_command
{
    std::string token;
};

// Subscribes the connection to a room
struct join_command
{
    std::string room;
};

// Unsubscribes the connection from a room
struct leave_command
{
    std::string room;
};

// Sends a message to a room
struct channel_command
{
    std::string room;
    std::string body;
};

// Sends a direct message
struct dm_command
{
    user_identity to;
    std::string body;
};

struct block_command
{
    user_identity user_id;
};

struct unblock_command
{
    user_identity user_id;
};

struct ping_command
{
};

using any_client_command = boost::variant2::variant<
    error_code,  // Invalid, used to report errors
    auth_command,
    join_command,
    leave_command,
    channel_command,
    dm_command,
    block_command,
    unblock_command,
    ping_command>;

// Parses a frame sent by the client. Frames that aren't JSON objects,
// have an unknown type or miss required fields yield errc::malformed_command
any_client_command parse_client_command(std::string_view from);

//
// Websocket API: server to client frames
//

// A room message or DM
struct message_event
{
    const message& msg;

    // Serializes the object as a JSON string.
    std::string to_json() const;
};

// Someone's presence in a room changed
struct presence_event
{
    std::string_view user_id;
    bool online;

    std::string to_json() const;
};

// Sent once the connection becomes active
struct welcome_event
{
    std::string_view user_id;

    std::string to_json() const;
};

// Ack for join. members are the identities present in the room, including the joining one
struct joined_event
{
    std::string_view room;
    boost::span<const user_identity> members;

    std::string to_json() const;
};

// Ack for leave
struct left_event
{
    std::string_view room;

    std::string to_json() const;
};

// Ack for block and unblock
struct block_ack_event
{
    std::string_view user_id;
    bool blocked;

    std::string to_json() const;
};

struct pong_event
{
    timestamp_t ts;

    std::string to_json() const;
};

// A command failed. ec should be in the lobbychat category
struct error_event
{
    error_code ec;

    std::string to_json() const;
};

// Invites and tournament announcements
struct notification_event
{
    const notification& evt;

    std::string to_json() const;
};

//
// HTTP API
//

enum class api_error_id
{
    // generic, when there is not a more specific error ID
    bad_request = 0,

    // The request requires a valid bearer token
    unauthorized,

    // The pagination cursor is malformed
    invalid_cursor,

    // Something went wrong on our side
    internal_error,
};

struct api_error
{
    // An identifier for the error that occurred.
    api_error_id error_id;

    // A human-readable explanation of the error.
    std::string_view error_message;

    // Serializes the object as a JSON string.
    std::string to_json() const;
};

// Response for the history endpoints
struct history_response
{
    const history_page& page;

    std::string to_json() const;
};

// Response for the block list endpoint
struct blocks_response
{
    // Users blocked by the requester, sorted
    boost::span<const user_identity> blocked;

    std::string to_json() const;
};

// Response for the conversation list endpoint
struct conversations_response
{
    // Most recent first
    boost::span<const conversation_summary> conversations;

    std::string to_json() const;
};

// Request body for the notification intake
struct notify_request
{
    // Who should receive the notification
    user_identity user_id;

    // What to deliver
    notification event;

    // Parses a request from a JSON string
    static result<notify_request> from_json(std::string_view from);
};

struct notify_response
{
    // Number of connections the notification was queued to
    std::size_t delivered;

    std::string to_json() const;
};

}  // namespace lobbychat

#endif
