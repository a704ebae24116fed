//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LOBBYCHAT_SERVER_INCLUDE_CORE_SESSION_REGISTRY_HPP
#define LOBBYCHAT_SERVER_INCLUDE_CORE_SESSION_REGISTRY_HPP

#include <boost/core/span.hpp>
#include <boost/multi_index/indexed_by.hpp>
#include <boost/multi_index/mem_fun.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index_container.hpp>

#include <cstddef>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "business_types.hpp"
#include "core/connection.hpp"
#include "error.hpp"

namespace lobbychat {

// Receives presence edges from the session registry
class presence_listener
{
public:
    virtual ~presence_listener() {}

    // Called when an identity goes from zero to one live connections
    virtual void on_online(const user_identity& identity) = 0;

    // Called when the last live connection of an identity is unregistered.
    // rooms contains every room where the identity was announced during this online period
    virtual void on_offline(const user_identity& identity, boost::span<const std::string> rooms) = 0;
};

// Tracks live connections, indexed by connection ID and identity,
// and the rooms each connection has joined.
// Not thread-safe: all operations must run within the same strand.
// None of them suspend, so they appear atomic to coroutines.
class session_registry
{
    // The type of elements held by the subscription container
    struct room_subscription
    {
        std::string room;
        std::shared_ptr<connection> conn;

        const connection* conn_ptr() const noexcept { return conn.get(); }
    };

    // clang-format off
    using connection_container = boost::multi_index::multi_index_container<
        std::shared_ptr<connection>,
        boost::multi_index::indexed_by<
            // Index by connection ID
            boost::multi_index::ordered_unique<
                boost::multi_index::const_mem_fun<connection, connection_id, &connection::id>
            >,
            // Index by identity. A user may have several connections
            boost::multi_index::ordered_non_unique<
                boost::multi_index::const_mem_fun<connection, const user_identity&, &connection::identity>
            >
        >
    >;

    using subscription_container = boost::multi_index::multi_index_container<
        room_subscription,
        boost::multi_index::indexed_by<
            // Index by room
            boost::multi_index::ordered_non_unique<
                boost::multi_index::member<room_subscription, std::string, &room_subscription::room>
            >,
            // Index by connection (comparing pointers)
            boost::multi_index::ordered_non_unique<
                boost::multi_index::const_mem_fun<room_subscription, const connection*, &room_subscription::conn_ptr>
            >
        >
    >;
    // clang-format on

    connection_container connections_;
    subscription_container subscriptions_;

    // Rooms where each online identity has been announced
    std::unordered_map<user_identity, std::set<std::string>> announced_rooms_;

    presence_listener* listener_{};
    connection_id last_id_{};

    const room_subscription* find_subscription(const connection& conn, std::string_view room) const;

public:
    session_registry() = default;
    session_registry(const session_registry&) = delete;
    session_registry& operator=(const session_registry&) = delete;

    // The listener is notified about presence edges. May be nullptr
    void set_presence_listener(presence_listener* listener) noexcept { listener_ = listener; }

    // Allocates a fresh connection ID
    connection_id next_connection_id() noexcept { return ++last_id_; }

    // Adds an authenticated connection. Fails if the ID is already registered.
    // Triggers the online edge if this is the identity's first connection
    error_code register_connection(std::shared_ptr<connection> conn);

    // Removes a connection and all its subscriptions. No-op if it's not registered.
    // Triggers the offline edge if this was the identity's last connection
    void unregister_connection(connection_id id);

    // Closes a connection with the given reason and unregisters it
    void close(connection& conn, close_reason why);

    // Looks up a registered connection
    std::shared_ptr<connection> find(connection_id id) const;

    // All live connections of an identity
    std::vector<std::shared_ptr<connection>> connections_for(std::string_view identity) const;

    bool is_online(std::string_view identity) const;

    std::size_t size() const noexcept { return connections_.size(); }

    // Subscribes a registered connection to a room. Idempotent.
    // Returns true if this is the first time the connection's identity
    // becomes present in the room during its online period.
    result<bool> subscribe(connection_id id, std::string_view room);

    // Removes a single subscription. Returns true if the connection's identity
    // is no longer present in the room, which then stops being announced.
    // Returns false if the subscription doesn't exist
    bool unsubscribe(connection_id id, std::string_view room);

    // Whether conn is subscribed to any room where identity is announced
    bool shares_presence(const connection& conn, std::string_view identity) const;

    bool is_subscribed(connection_id id, std::string_view room) const;

    // All connections subscribed to a room
    std::vector<std::shared_ptr<connection>> subscribers_of(std::string_view room) const;

    // Distinct identities subscribed to a room, sorted
    std::vector<user_identity> members_of(std::string_view room) const;
};

}  // namespace lobbychat

#endif
