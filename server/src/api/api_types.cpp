//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "api/api_types.hpp"

#include <boost/describe/class.hpp>
#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value.hpp>
#include <boost/json/value_from.hpp>
#include <boost/json/value_to.hpp>
#include <boost/variant2/variant.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "business_types.hpp"
#include "services/history_service.hpp"

using namespace lobbychat;

//
// Wire structs. Frames with a fixed shape are serialized
// using Boost.Describe metadata
//
namespace {

struct wire_presence
{
    std::string_view type;
    std::string_view userId;
    bool online;
};
BOOST_DESCRIBE_STRUCT(wire_presence, (), (type, userId, online))

struct wire_user_ack
{
    std::string_view type;
    std::string_view userId;
};
BOOST_DESCRIBE_STRUCT(wire_user_ack, (), (type, userId))

struct wire_room_ack
{
    std::string_view type;
    std::string_view room;
};
BOOST_DESCRIBE_STRUCT(wire_room_ack, (), (type, room))

struct wire_conversation
{
    std::string_view userId;
    std::int64_t lastMessageAt;
};
BOOST_DESCRIBE_STRUCT(wire_conversation, (), (userId, lastMessageAt))

struct wire_pong
{
    std::string_view type;
    std::int64_t ts;
};
BOOST_DESCRIBE_STRUCT(wire_pong, (), (type, ts))

struct wire_error
{
    std::string_view type;
    std::string_view kind;
    std::string_view message;
};
BOOST_DESCRIBE_STRUCT(wire_error, (), (type, kind, message))

struct wire_invite
{
    std::string_view type;
    std::string_view fromUserId;
    std::string_view matchId;
};
BOOST_DESCRIBE_STRUCT(wire_invite, (), (type, fromUserId, matchId))

struct wire_tournament_announce
{
    std::string_view type;
    std::string_view matchId;
    std::string_view p1;
    std::string_view p2;
    std::int64_t eta;
};
BOOST_DESCRIBE_STRUCT(wire_tournament_announce, (), (type, matchId, p1, p2, eta))

struct wire_api_error
{
    std::string_view id;
    std::string_view message;
};
BOOST_DESCRIBE_STRUCT(wire_api_error, (), (id, message))

struct wire_notify_response
{
    std::size_t delivered;
};
BOOST_DESCRIBE_STRUCT(wire_notify_response, (), (delivered))

template <class T>
std::string to_json_string(const T& input)
{
    return boost::json::serialize(boost::json::value_from(input));
}

//
// Incoming wire structs. They are an exact representation of what clients send,
// including the type discriminator, and are parsed with boost::json::try_value_to.
// Validation beyond types and presence happens once they are parsed.
//
struct wire_auth_command
{
    std::string type;
    std::string token;
};
BOOST_DESCRIBE_STRUCT(wire_auth_command, (), (type, token))

// join and leave
struct wire_room_command
{
    std::string type;
    std::string room;
};
BOOST_DESCRIBE_STRUCT(wire_room_command, (), (type, room))

struct wire_channel_command
{
    std::string type;
    std::string room;
    std::string body;
};
BOOST_DESCRIBE_STRUCT(wire_channel_command, (), (type, room, body))

struct wire_dm_command
{
    std::string type;
    std::string to;
    std::string body;
};
BOOST_DESCRIBE_STRUCT(wire_dm_command, (), (type, to, body))

// block and unblock
struct wire_user_command
{
    std::string type;
    std::string userId;
};
BOOST_DESCRIBE_STRUCT(wire_user_command, (), (type, userId))

struct wire_notify_request
{
    std::string userId;
    boost::json::value event;
};
BOOST_DESCRIBE_STRUCT(wire_notify_request, (), (userId, event))

struct wire_invite_notification
{
    std::string type;
    std::string fromUserId;
    std::string matchId;
};
BOOST_DESCRIBE_STRUCT(wire_invite_notification, (), (type, fromUserId, matchId))

struct wire_tournament_notification
{
    std::string type;
    std::string matchId;
    std::string p1;
    std::string p2;
    std::int64_t eta;
};
BOOST_DESCRIBE_STRUCT(wire_tournament_notification, (), (type, matchId, p1, p2, eta))

// Parses a JSON object into one of the wire structs.
// Any mismatch is reported as errc::malformed_command
template <class T>
result<T> parse_wire(const boost::json::value& from)
{
    auto res = boost::json::try_value_to<T>(from);
    if (res.has_error())
        LOBBYCHAT_RETURN_ERROR(errc::malformed_command)
    return res;
}

// Parses a JSON object and retrieves its type discriminator
result<std::string_view> get_type(const boost::json::value& from)
{
    const auto* obj = from.if_object();
    if (!obj)
        LOBBYCHAT_RETURN_ERROR(errc::malformed_command)
    auto it = obj->find("type");
    if (it == obj->end() || !it->value().is_string())
        LOBBYCHAT_RETURN_ERROR(errc::malformed_command)
    return std::string_view(it->value().get_string());
}

bool is_valid_room_name(std::string_view room) noexcept
{
    return !room.empty() && room.size() <= max_room_name_length;
}

bool is_valid_user_id(std::string_view user_id) noexcept
{
    return !user_id.empty() && user_id.size() <= max_user_id_length;
}

}  // namespace

//
// Client commands
//
any_client_command lobbychat::parse_client_command(std::string_view from)
{
    // Parse the JSON
    error_code ec;
    auto msg = boost::json::parse(from, ec);
    if (ec)
        LOBBYCHAT_RETURN_ERROR(errc::malformed_command)

    // Get the command type
    auto type = get_type(msg);
    if (type.has_error())
        return type.error();

    // Parse the command, depending on its type
    if (*type == "join" || *type == "leave")
    {
        auto cmd = parse_wire<wire_room_command>(msg);
        if (cmd.has_error())
            return cmd.error();
        if (!is_valid_room_name(cmd->room))
            LOBBYCHAT_RETURN_ERROR(errc::malformed_command)
        if (*type == "join")
            return join_command{std::move(cmd->room)};
        else
            return leave_command{std::move(cmd->room)};
    }
    else if (*type == "channel")
    {
        auto cmd = parse_wire<wire_channel_command>(msg);
        if (cmd.has_error())
            return cmd.error();
        if (!is_valid_room_name(cmd->room))
            LOBBYCHAT_RETURN_ERROR(errc::malformed_command)
        return channel_command{std::move(cmd->room), std::move(cmd->body)};
    }
    else if (*type == "dm")
    {
        auto cmd = parse_wire<wire_dm_command>(msg);
        if (cmd.has_error())
            return cmd.error();
        if (!is_valid_user_id(cmd->to))
            LOBBYCHAT_RETURN_ERROR(errc::malformed_command)
        return dm_command{std::move(cmd->to), std::move(cmd->body)};
    }
    else if (*type == "block" || *type == "unblock")
    {
        auto cmd = parse_wire<wire_user_command>(msg);
        if (cmd.has_error())
            return cmd.error();
        if (!is_valid_user_id(cmd->userId))
            LOBBYCHAT_RETURN_ERROR(errc::malformed_command)
        if (*type == "block")
            return block_command{std::move(cmd->userId)};
        else
            return unblock_command{std::move(cmd->userId)};
    }
    else if (*type == "ping")
    {
        return ping_command{};
    }
    else if (*type == "auth")
    {
        auto cmd = parse_wire<wire_auth_command>(msg);
        if (cmd.has_error())
            return cmd.error();
        return auth_command{std::move(cmd->token)};
    }
    else
    {
        // Unknown type
        LOBBYCHAT_RETURN_ERROR(errc::malformed_command)
    }
}

//
// Server frames
//
static boost::json::object serialize_message(const message& input)
{
    boost::json::object res{
        {"id",   input.id                               },
        {"from", input.sender_id                        },
        {"body", input.body                             },
        {"ts",   serialize_timestamp(input.created_at)},
    };
    if (const auto* room = input.room())
        res.emplace("room", *room);
    else
        res.emplace("to", *input.recipient_id());
    return res;
}

std::string message_event::to_json() const
{
    auto res = serialize_message(msg);
    res.emplace("type", "message");
    return boost::json::serialize(res);
}

std::string presence_event::to_json() const { return to_json_string(wire_presence{"presence", user_id, online}); }

std::string welcome_event::to_json() const { return to_json_string(wire_user_ack{"welcome", user_id}); }

std::string joined_event::to_json() const
{
    boost::json::array json_members;
    json_members.reserve(members.size());
    for (const auto& member : members)
        json_members.emplace_back(member);

    boost::json::object res;
    res.emplace("type", "joined");
    res.emplace("room", room);
    res.emplace("members", std::move(json_members));
    return boost::json::serialize(res);
}

std::string left_event::to_json() const { return to_json_string(wire_room_ack{"left", room}); }

std::string block_ack_event::to_json() const
{
    return to_json_string(wire_user_ack{blocked ? "blocked" : "unblocked", user_id});
}

std::string pong_event::to_json() const { return to_json_string(wire_pong{"pong", serialize_timestamp(ts)}); }

// Human-readable explanations. They never include details about the failure
static std::string_view error_message(error_code ec)
{
    if (ec.category() != get_lobbychat_category())
        return "Internal error";

    switch (static_cast<errc>(ec.value()))
    {
    case errc::unauthorized: return "Authentication required";
    case errc::malformed_command: return "The command could not be parsed";
    case errc::invalid_message: return "Messages must contain between 1 and 2000 characters";
    case errc::blocked: return "You can't message this user";
    case errc::rate_limited: return "Too many commands, slow down";
    case errc::slow_consumer: return "Too many pending messages";
    case errc::persistence_failure: return "The command could not be completed, please retry";
    case errc::not_joined: return "Join the room before sending messages to it";
    case errc::invalid_target: return "You can't target yourself";
    default: return "Internal error";
    }
}

std::string error_event::to_json() const
{
    return to_json_string(wire_error{"error", error_kind(ec), error_message(ec)});
}

namespace {

struct notification_serializer
{
    std::string operator()(const invite_notification& evt) const
    {
        return to_json_string(wire_invite{"invite", evt.from_user_id, evt.match_id});
    }

    std::string operator()(const tournament_announce_notification& evt) const
    {
        return to_json_string(
            wire_tournament_announce{"tournamentAnnounce", evt.match_id, evt.p1, evt.p2, serialize_timestamp(evt.eta)}
        );
    }
};

}  // namespace

std::string notification_event::to_json() const
{
    return boost::variant2::visit(notification_serializer{}, evt);
}

//
// HTTP API
//
static std::string_view to_string(api_error_id input)
{
    switch (input)
    {
    case api_error_id::unauthorized: return "UNAUTHORIZED";
    case api_error_id::invalid_cursor: return "INVALID_CURSOR";
    case api_error_id::internal_error: return "INTERNAL_ERROR";
    case api_error_id::bad_request:
    default: return "BAD_REQUEST";
    }
}

std::string api_error::to_json() const
{
    return to_json_string(wire_api_error{to_string(error_id), error_message});
}

std::string history_response::to_json() const
{
    boost::json::array json_messages;
    json_messages.reserve(page.messages.size());
    for (const auto& msg : page.messages)
        json_messages.push_back(serialize_message(msg));

    boost::json::object res;
    res.emplace("messages", std::move(json_messages));
    if (page.next_cursor)
        res.emplace("nextCursor", *page.next_cursor);
    return boost::json::serialize(res);
}

std::string blocks_response::to_json() const
{
    boost::json::array json_blocked;
    json_blocked.reserve(blocked.size());
    for (const auto& user_id : blocked)
        json_blocked.emplace_back(user_id);

    boost::json::object res;
    res.emplace("blocked", std::move(json_blocked));
    return boost::json::serialize(res);
}

std::string conversations_response::to_json() const
{
    boost::json::array json_conversations;
    json_conversations.reserve(conversations.size());
    for (const auto& conv : conversations)
    {
        json_conversations.push_back(
            boost::json::value_from(wire_conversation{conv.peer, serialize_timestamp(conv.last_message_at)})
        );
    }

    boost::json::object res;
    res.emplace("conversations", std::move(json_conversations));
    return boost::json::serialize(res);
}

static result<notification> parse_notification(const boost::json::value& from)
{
    auto type = get_type(from);
    if (type.has_error())
        return type.error();

    if (*type == "invite")
    {
        auto evt = parse_wire<wire_invite_notification>(from);
        if (evt.has_error())
            return evt.error();
        if (!is_valid_user_id(evt->fromUserId))
            LOBBYCHAT_RETURN_ERROR(errc::malformed_command)
        return notification(invite_notification{std::move(evt->fromUserId), std::move(evt->matchId)});
    }
    else if (*type == "tournamentAnnounce")
    {
        auto evt = parse_wire<wire_tournament_notification>(from);
        if (evt.has_error())
            return evt.error();
        if (!is_valid_user_id(evt->p1) || !is_valid_user_id(evt->p2))
            LOBBYCHAT_RETURN_ERROR(errc::malformed_command)
        return notification(tournament_announce_notification{
            std::move(evt->matchId),
            std::move(evt->p1),
            std::move(evt->p2),
            parse_timestamp(evt->eta),
        });
    }
    else
    {
        LOBBYCHAT_RETURN_ERROR(errc::malformed_command)
    }
}

result<notify_request> notify_request::from_json(std::string_view from)
{
    // Parse the JSON
    error_code ec;
    auto msg = boost::json::parse(from, ec);
    if (ec)
        LOBBYCHAT_RETURN_ERROR(ec)

    // Parse into the struct
    auto req = parse_wire<wire_notify_request>(msg);
    if (req.has_error())
        return req.error();
    if (!is_valid_user_id(req->userId))
        LOBBYCHAT_RETURN_ERROR(errc::malformed_command)

    auto evt = parse_notification(req->event);
    if (evt.has_error())
        return evt.error();
    return notify_request{std::move(req->userId), std::move(*evt)};
}

std::string notify_response::to_json() const { return to_json_string(wire_notify_response{delivered}); }
