//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LOBBYCHAT_SERVER_INCLUDE_CORE_ROUTER_HPP
#define LOBBYCHAT_SERVER_INCLUDE_CORE_ROUTER_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/core/span.hpp>

#include <memory>
#include <string>
#include <string_view>

#include "business_types.hpp"
#include "core/connection.hpp"
#include "core/rate_limiter.hpp"
#include "core/session_registry.hpp"
#include "util/keyed_mutex.hpp"

namespace lobbychat {

class block_registry;
class history_store;
class identity_verifier;

// Checks that a message body contains between 1 and max_body_length
// code points, once leading and trailing whitespace is removed
bool is_valid_message_body(std::string_view body) noexcept;

// Drives the per-connection state machine: authenticates connections,
// validates and admits commands, enforces blocks, persists messages and
// fans them out. Also propagates presence, as the registry's listener.
class router final : public presence_listener
{
    session_registry* sessions_;
    block_registry* blocks_;
    history_store* history_;
    identity_verifier* verifier_;
    connection_limits limits_;

    // Serializes persist + fan-out per conversation
    keyed_mutex conversation_locks_;

    // Last timestamp assigned to a message. Keeps created_at non-decreasing
    timestamp_t last_timestamp_{};

    struct command_visitor;

    void deliver(connection& conn, outbound_frame frame);
    void reply(connection& conn, std::string payload);
    void reply_error(connection& conn, error_code ec);
    void reject_unauthorized(connection& conn);
    void on_malformed(connection& conn);
    timestamp_t next_timestamp() noexcept;

    // Persists msg and delivers it to the given connections.
    // The caller must hold the conversation's lock.
    // recipients is evaluated after the message is persisted
    template <class RecipientsFn>
    boost::asio::awaitable<void> publish(connection& sender, message msg, RecipientsFn recipients);

    boost::asio::awaitable<void> handle_join(connection& conn, std::string room);
    void handle_leave(connection& conn, const std::string& room);
    boost::asio::awaitable<void> handle_channel(connection& conn, std::string room, std::string body);
    boost::asio::awaitable<void> handle_dm(connection& conn, user_identity to, std::string body);
    boost::asio::awaitable<void> handle_block(connection& conn, user_identity target, bool block);
    void handle_ping(connection& conn);

public:
    router(
        boost::asio::any_io_executor ex,
        session_registry& sessions,
        block_registry& blocks,
        history_store& history,
        identity_verifier& verifier,
        const connection_limits& limits
    );
    router(const router&) = delete;
    router& operator=(const router&) = delete;
    ~router();

    // Creates a connection in the connecting state, for a freshly accepted transport
    std::shared_ptr<connection> create_connection(boost::asio::any_io_executor ex);

    // Resolves token to an identity and activates the connection.
    // On failure, replies with Unauthorized and closes the connection
    boost::asio::awaitable<void> authenticate(std::shared_ptr<connection> conn, std::string token);

    // Processes an inbound frame. Frames from a connection must be
    // handled one at a time, in receipt order
    boost::asio::awaitable<void> handle_frame(std::shared_ptr<connection> conn, std::string_view raw);

    // Closes a connection and unregisters it
    void close(connection& conn, close_reason why);

    // presence_listener
    void on_online(const user_identity& identity) override;
    void on_offline(const user_identity& identity, boost::span<const std::string> rooms) override;
};

}  // namespace lobbychat

#endif
