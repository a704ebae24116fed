//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "core/session_registry.hpp"

#include <algorithm>
#include <utility>

using namespace lobbychat;

const session_registry::room_subscription* session_registry::find_subscription(
    const connection& conn,
    std::string_view room
) const
{
    // A connection joins few rooms, so a linear scan over them is fine
    auto [first, last] = subscriptions_.get<1>().equal_range(&conn);
    for (auto it = first; it != last; ++it)
    {
        if (it->room == room)
            return &*it;
    }
    return nullptr;
}

error_code session_registry::register_connection(std::shared_ptr<connection> conn)
{
    if (conn->identity().empty())
        LOBBYCHAT_RETURN_ERROR(errc::unauthorized)

    bool first_connection = connections_.get<1>().count(conn->identity()) == 0u;
    user_identity identity = conn->identity();

    if (!connections_.insert(std::move(conn)).second)
        LOBBYCHAT_RETURN_ERROR(errc::duplicate_connection)

    if (first_connection)
    {
        announced_rooms_.erase(identity);
        if (listener_)
            listener_->on_online(identity);
    }

    return error_code();
}

void session_registry::unregister_connection(connection_id id)
{
    auto it = connections_.find(id);
    if (it == connections_.end())
        return;

    // Keep the connection alive while we clean up
    std::shared_ptr<connection> conn = *it;
    subscriptions_.get<1>().erase(conn.get());
    connections_.erase(it);

    // Offline edge
    if (connections_.get<1>().count(conn->identity()) == 0u)
    {
        std::vector<std::string> rooms;
        auto rooms_it = announced_rooms_.find(conn->identity());
        if (rooms_it != announced_rooms_.end())
        {
            rooms.assign(rooms_it->second.begin(), rooms_it->second.end());
            announced_rooms_.erase(rooms_it);
        }
        if (listener_)
            listener_->on_offline(conn->identity(), rooms);
    }
}

void session_registry::close(connection& conn, close_reason why)
{
    conn.close(why);
    unregister_connection(conn.id());
}

std::shared_ptr<connection> session_registry::find(connection_id id) const
{
    auto it = connections_.find(id);
    return it == connections_.end() ? nullptr : *it;
}

std::vector<std::shared_ptr<connection>> session_registry::connections_for(std::string_view identity) const
{
    auto [first, last] = connections_.get<1>().equal_range(user_identity(identity));
    return std::vector<std::shared_ptr<connection>>(first, last);
}

bool session_registry::is_online(std::string_view identity) const
{
    return connections_.get<1>().count(user_identity(identity)) != 0u;
}

result<bool> session_registry::subscribe(connection_id id, std::string_view room)
{
    auto conn = find(id);
    if (!conn)
        LOBBYCHAT_RETURN_ERROR(errc::not_found)

    if (!find_subscription(*conn, room))
        subscriptions_.insert(room_subscription{std::string(room), conn});

    // set::insert tells us whether the identity had already been announced
    return announced_rooms_[conn->identity()].insert(std::string(room)).second;
}

bool session_registry::unsubscribe(connection_id id, std::string_view room)
{
    auto conn = find(id);
    if (!conn)
        return false;
    const auto* sub = find_subscription(*conn, room);
    if (!sub)
        return false;
    auto& by_conn = subscriptions_.get<1>();
    by_conn.erase(by_conn.iterator_to(*sub));

    // Other connections of the same identity keep it present
    for (const auto& other : connections_for(conn->identity()))
    {
        if (find_subscription(*other, room))
            return false;
    }

    auto it = announced_rooms_.find(conn->identity());
    if (it != announced_rooms_.end())
        it->second.erase(std::string(room));
    return true;
}

bool session_registry::shares_presence(const connection& conn, std::string_view identity) const
{
    auto rooms_it = announced_rooms_.find(user_identity(identity));
    if (rooms_it == announced_rooms_.end())
        return false;
    auto [first, last] = subscriptions_.get<1>().equal_range(&conn);
    for (auto it = first; it != last; ++it)
    {
        if (rooms_it->second.count(it->room))
            return true;
    }
    return false;
}

bool session_registry::is_subscribed(connection_id id, std::string_view room) const
{
    auto conn = find(id);
    return conn && find_subscription(*conn, room) != nullptr;
}

std::vector<std::shared_ptr<connection>> session_registry::subscribers_of(std::string_view room) const
{
    std::vector<std::shared_ptr<connection>> res;
    auto [first, last] = subscriptions_.equal_range(std::string(room));
    for (auto it = first; it != last; ++it)
        res.push_back(it->conn);
    return res;
}

std::vector<user_identity> session_registry::members_of(std::string_view room) const
{
    std::vector<user_identity> res;
    auto [first, last] = subscriptions_.equal_range(std::string(room));
    for (auto it = first; it != last; ++it)
        res.push_back(it->conn->identity());
    std::sort(res.begin(), res.end());
    res.erase(std::unique(res.begin(), res.end()), res.end());
    return res;
}
