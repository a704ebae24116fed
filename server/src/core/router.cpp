//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "core/router.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/variant2/variant.hpp>

#include <algorithm>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "api/api_types.hpp"
#include "error.hpp"
#include "services/block_registry.hpp"
#include "services/history_store.hpp"
#include "services/identity_verifier.hpp"

using namespace lobbychat;
namespace asio = boost::asio;

bool lobbychat::is_valid_message_body(std::string_view body) noexcept
{
    // Trim ASCII whitespace
    constexpr std::string_view whitespace = " \t\n\r\f\v";
    auto first = body.find_first_not_of(whitespace);
    if (first == std::string_view::npos)
        return false;
    auto last = body.find_last_not_of(whitespace);
    body = body.substr(first, last - first + 1);

    // Count code points. The JSON parser already validated the encoding,
    // so counting the bytes that don't continue a sequence is enough
    auto code_points = std::count_if(body.begin(), body.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xc0) != 0x80;
    });
    return static_cast<std::size_t>(code_points) <= max_body_length;
}

// Which budget each command draws from
static command_class classify(const any_client_command& cmd) noexcept
{
    return boost::variant2::holds_alternative<block_command>(cmd) ||
                   boost::variant2::holds_alternative<unblock_command>(cmd)
               ? command_class::moderation
               : command_class::chat;
}

// Conversation keys. A DM conversation is the same regardless of who sends
static std::string room_key(std::string_view room) { return "room:" + std::string(room); }

static std::string dm_key(std::string_view a, std::string_view b)
{
    if (b < a)
        std::swap(a, b);
    std::string res = "dm:";
    res += a;
    res += '\n';
    res += b;
    return res;
}

router::router(
    asio::any_io_executor ex,
    session_registry& sessions,
    block_registry& blocks,
    history_store& history,
    identity_verifier& verifier,
    const connection_limits& limits
)
    : sessions_(&sessions),
      blocks_(&blocks),
      history_(&history),
      verifier_(&verifier),
      limits_(limits),
      conversation_locks_(std::move(ex))
{
    sessions_->set_presence_listener(this);
}

router::~router() { sessions_->set_presence_listener(nullptr); }

std::shared_ptr<connection> router::create_connection(asio::any_io_executor ex)
{
    return std::make_shared<connection>(sessions_->next_connection_id(), std::move(ex), limits_);
}

void router::close(connection& conn, close_reason why) { sessions_->close(conn, why); }

void router::deliver(connection& conn, outbound_frame frame)
{
    if (conn.send(std::move(frame)) == enqueue_result::slow_consumer)
        close(conn, close_reason::slow_consumer);
}

void router::reply(connection& conn, std::string payload)
{
    deliver(conn, {std::make_shared<const std::string>(std::move(payload)), frame_class::system});
}

void router::reply_error(connection& conn, error_code ec) { reply(conn, error_event{ec}.to_json()); }

void router::reject_unauthorized(connection& conn)
{
    // The error frame is flushed before the transport closes
    reply_error(conn, errc::unauthorized);
    close(conn, close_reason::unauthorized);
}

void router::on_malformed(connection& conn)
{
    reply_error(conn, errc::malformed_command);
    if (conn.record_malformed() > limits_.max_malformed)
        close(conn, close_reason::protocol_abuse);
}

timestamp_t router::next_timestamp() noexcept
{
    last_timestamp_ = (std::max)(last_timestamp_, current_timestamp());
    return last_timestamp_;
}

asio::awaitable<void> router::authenticate(std::shared_ptr<connection> conn, std::string token)
{
    auto identity = co_await verifier_->verify(token);

    // The transport may have gone away while we were waiting
    if (conn->state() != connection_state::connecting)
        co_return;

    if (identity.has_error())
    {
        // Don't leak details to the client. Invalid credentials are expected
        if (identity.error() != errc::unauthorized)
            log_error(identity.error(), "Error verifying identity");
        reject_unauthorized(*conn);
        co_return;
    }

    conn->set_authenticated(std::move(*identity));
    auto ec = sessions_->register_connection(conn);
    if (ec)
    {
        log_error(ec, "Error registering connection");
        reply_error(*conn, ec);
        conn->close(close_reason::server_error);
        co_return;
    }

    conn->set_active();
    reply(*conn, welcome_event{conn->identity()}.to_json());
}

// Dispatches each command to its handler
struct router::command_visitor
{
    router& self;
    connection& conn;

    asio::awaitable<void> operator()(const error_code&) const
    {
        self.on_malformed(conn);
        co_return;
    }

    asio::awaitable<void> operator()(const auth_command&) const
    {
        // Already authenticated
        self.on_malformed(conn);
        co_return;
    }

    asio::awaitable<void> operator()(join_command& cmd) const
    {
        return self.handle_join(conn, std::move(cmd.room));
    }

    asio::awaitable<void> operator()(const leave_command& cmd) const
    {
        self.handle_leave(conn, cmd.room);
        co_return;
    }

    asio::awaitable<void> operator()(channel_command& cmd) const
    {
        return self.handle_channel(conn, std::move(cmd.room), std::move(cmd.body));
    }

    asio::awaitable<void> operator()(dm_command& cmd) const
    {
        return self.handle_dm(conn, std::move(cmd.to), std::move(cmd.body));
    }

    asio::awaitable<void> operator()(block_command& cmd) const
    {
        return self.handle_block(conn, std::move(cmd.user_id), true);
    }

    asio::awaitable<void> operator()(unblock_command& cmd) const
    {
        return self.handle_block(conn, std::move(cmd.user_id), false);
    }

    asio::awaitable<void> operator()(const ping_command&) const
    {
        self.handle_ping(conn);
        co_return;
    }
};

asio::awaitable<void> router::handle_frame(std::shared_ptr<connection> conn, std::string_view raw)
{
    if (conn->is_closed())
        co_return;

    auto cmd = parse_client_command(raw);

    if (conn->state() == connection_state::connecting)
    {
        if (auto* auth = boost::variant2::get_if<auth_command>(&cmd))
            co_await authenticate(conn, std::move(auth->token));
        else if (boost::variant2::holds_alternative<error_code>(cmd))
            on_malformed(*conn);
        else
            reject_unauthorized(*conn);
        co_return;
    }

    // Malformed frames don't consume budget
    bool is_command = !boost::variant2::holds_alternative<error_code>(cmd) &&
                      !boost::variant2::holds_alternative<auth_command>(cmd);
    if (is_command && !conn->limiter().try_admit(classify(cmd)))
    {
        reply_error(*conn, errc::rate_limited);
        co_return;
    }

    co_await boost::variant2::visit(command_visitor{*this, *conn}, cmd);
}

asio::awaitable<void> router::handle_join(connection& conn, std::string room)
{
    auto newly_present = sessions_->subscribe(conn.id(), room);
    if (newly_present.has_error())
    {
        // The connection was unregistered concurrently
        co_return;
    }

    auto members = sessions_->members_of(room);
    reply(conn, joined_event{room, members}.to_json());

    // The member list tells the joining connection who is online
    for (const auto& member : members)
    {
        if (member != conn.identity())
            conn.mark_present(member);
    }

    // Let the others know. Peers that already share a room with us were told before
    if (*newly_present)
    {
        auto payload = std::make_shared<const std::string>(presence_event{conn.identity(), true}.to_json());
        for (const auto& peer : sessions_->subscribers_of(room))
        {
            if (peer->identity() != conn.identity() && peer->mark_present(conn.identity()))
                deliver(*peer, {payload, frame_class::presence});
        }
    }
}

void router::handle_leave(connection& conn, const std::string& room)
{
    if (!sessions_->is_subscribed(conn.id(), room))
    {
        reply_error(conn, errc::not_joined);
        return;
    }

    bool identity_left = sessions_->unsubscribe(conn.id(), room);
    reply(conn, left_event{room}.to_json());

    // Stop tracking identities we no longer share a room with.
    // Their offline edge won't reach this connection
    std::vector<user_identity> known(conn.known_present().begin(), conn.known_present().end());
    for (const auto& identity : known)
    {
        if (!sessions_->shares_presence(conn, identity))
            conn.mark_absent(identity);
    }

    if (!identity_left)
        return;

    // Peers that still see us in another room aren't told
    std::vector<std::shared_ptr<connection>> targets;
    for (auto& peer : sessions_->subscribers_of(room))
    {
        if (peer->identity() != conn.identity() && !sessions_->shares_presence(*peer, conn.identity()) &&
            peer->mark_absent(conn.identity()))
        {
            targets.push_back(std::move(peer));
        }
    }

    auto payload = std::make_shared<const std::string>(presence_event{conn.identity(), false}.to_json());
    for (const auto& peer : targets)
        deliver(*peer, {payload, frame_class::presence});
}

template <class RecipientsFn>
asio::awaitable<void> router::publish(
    connection& sender,
    message msg,
    RecipientsFn recipients
)
{
    // Only live sessions can create messages
    if (sender.is_closed())
        co_return;

    msg.created_at = next_timestamp();
    auto id = co_await history_->append(msg);
    if (id.has_error())
    {
        log_error(id.error(), "Error persisting message");
        reply_error(sender, errc::persistence_failure);
        co_return;
    }
    msg.id = *id;

    // All recipients share the same payload
    auto payload = std::make_shared<const std::string>(message_event{msg}.to_json());
    for (const auto& conn : recipients())
        deliver(*conn, {payload, frame_class::chat});
}

asio::awaitable<void> router::handle_channel(connection& conn, std::string room, std::string body)
{
    if (!is_valid_message_body(body))
    {
        reply_error(conn, errc::invalid_message);
        co_return;
    }

    if (!sessions_->is_subscribed(conn.id(), room))
    {
        reply_error(conn, errc::not_joined);
        co_return;
    }

    // Messages in a conversation are persisted and delivered one at a time,
    // so every recipient observes commit order
    auto guard = co_await conversation_locks_.lock(room_key(room));
    message msg{0, conn.identity(), room_destination{room}, std::move(body), {}};
    co_await publish(conn, std::move(msg), [this, &room] {
        return sessions_->subscribers_of(room);
    });
}

asio::awaitable<void> router::handle_dm(connection& conn, user_identity to, std::string body)
{
    if (!is_valid_message_body(body))
    {
        reply_error(conn, errc::invalid_message);
        co_return;
    }

    if (to == conn.identity())
    {
        reply_error(conn, errc::invalid_target);
        co_return;
    }

    // Blocks for this pair are changed under the same lock,
    // so the check below stays valid until the message is delivered
    user_identity from = conn.identity();
    auto guard = co_await conversation_locks_.lock(dm_key(from, to));

    // Don't disclose who blocked whom
    auto blocked = co_await blocks_->is_blocked(conn.identity(), to);
    if (blocked.has_error())
    {
        log_error(blocked.error(), "Error checking blocks");
        reply_error(conn, errc::persistence_failure);
        co_return;
    }
    if (*blocked)
    {
        reply_error(conn, errc::blocked);
        co_return;
    }

    // Sender's connections also get the message, so all their devices stay in sync
    message msg{0, from, dm_destination{to}, std::move(body), {}};
    co_await publish(conn, std::move(msg), [this, &from, &to] {
        auto res = sessions_->connections_for(to);
        auto own = sessions_->connections_for(from);
        res.insert(res.end(), own.begin(), own.end());
        return res;
    });
}

asio::awaitable<void> router::handle_block(connection& conn, user_identity target, bool block)
{
    if (target == conn.identity())
    {
        reply_error(conn, errc::invalid_target);
        co_return;
    }

    // Don't let a DM between the pair interleave with the update
    auto guard = co_await conversation_locks_.lock(dm_key(conn.identity(), target));

    error_code ec;
    if (block)
        ec = co_await blocks_->add(conn.identity(), target);
    else
        ec = co_await blocks_->remove(conn.identity(), target);
    if (ec)
    {
        log_error(ec, "Error updating blocks");
        reply_error(conn, errc::persistence_failure);
        co_return;
    }

    reply(conn, block_ack_event{target, block}.to_json());
}

void router::handle_ping(connection& conn) { reply(conn, pong_event{current_timestamp()}.to_json()); }

void router::on_online(const user_identity&)
{
    // A fresh online period starts with no announced rooms.
    // Room peers are notified as the identity joins their rooms
}

void router::on_offline(const user_identity& identity, boost::span<const std::string> rooms)
{
    // A connection sharing several rooms with identity was told once it was online,
    // and gets a single notice
    std::vector<std::shared_ptr<connection>> targets;
    for (const auto& room : rooms)
    {
        for (auto& peer : sessions_->subscribers_of(room))
        {
            if (peer->mark_absent(identity))
                targets.push_back(std::move(peer));
        }
    }

    auto payload = std::make_shared<const std::string>(presence_event{identity, false}.to_json());
    for (const auto& peer : targets)
        deliver(*peer, {payload, frame_class::presence});
}
