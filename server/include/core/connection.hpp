//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LOBBYCHAT_SERVER_INCLUDE_CORE_CONNECTION_HPP
#define LOBBYCHAT_SERVER_INCLUDE_CORE_CONNECTION_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/cancellation_type.hpp>
#include <boost/asio/experimental/channel.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>

#include "business_types.hpp"
#include "core/outbound_queue.hpp"
#include "core/rate_limiter.hpp"
#include "error.hpp"

namespace lobbychat {

using connection_id = std::uint64_t;

enum class connection_state
{
    connecting,     // transport accepted, identity unknown
    authenticated,  // identity resolved, not yet registered
    active,         // registered, can send and receive frames
    closed,         // terminal
};

enum class close_reason
{
    none,              // not closed
    transport_closed,  // the client went away, or a write failed
    unauthorized,      // the credential was missing or invalid
    slow_consumer,     // the outbound queue overflowed
    protocol_abuse,    // too many malformed frames
    server_error,      // an unexpected error happened while setting up the connection
};

// A single client transport. Owns the per-connection outbound queue and
// rate budgets. The routing core pushes frames to it; the transport
// drains them from a separate coroutine.
class connection
{
    connection_id id_;
    user_identity identity_;
    connection_state state_{connection_state::connecting};
    close_reason close_reason_{close_reason::none};
    timestamp_t created_at_;
    outbound_queue queue_;
    rate_limiter limiter_;
    std::size_t malformed_count_{};

    // Identities this connection has been told are online
    std::set<user_identity> known_present_;

    // Wakes up the writer when frames are queued or the connection is closed
    boost::asio::experimental::channel<void(error_code)> ready_;

    // Aborts the write in progress when a slow consumer is dropped
    boost::asio::cancellation_signal write_cancel_;

    void notify_writer() noexcept { ready_.try_send(error_code()); }

public:
    connection(connection_id id, boost::asio::any_io_executor ex, const connection_limits& limits)
        : id_(id),
          created_at_(current_timestamp()),
          queue_(limits.outbound_depth),
          limiter_(limits),
          ready_(std::move(ex), 1)
    {
    }
    connection(const connection&) = delete;
    connection& operator=(const connection&) = delete;

    connection_id id() const noexcept { return id_; }
    const user_identity& identity() const noexcept { return identity_; }
    connection_state state() const noexcept { return state_; }
    close_reason reason() const noexcept { return close_reason_; }
    timestamp_t created_at() const noexcept { return created_at_; }
    bool is_closed() const noexcept { return state_ == connection_state::closed; }
    std::size_t pending_frames() const noexcept { return queue_.size(); }
    rate_limiter& limiter() noexcept { return limiter_; }

    // State transitions. They are only valid from the previous state
    void set_authenticated(user_identity identity)
    {
        if (state_ != connection_state::connecting)
            return;
        identity_ = std::move(identity);
        state_ = connection_state::authenticated;
    }

    void set_active() noexcept
    {
        if (state_ == connection_state::authenticated)
            state_ = connection_state::active;
    }

    // Moves the connection to the closed state. The first reason wins.
    // Pending frames are flushed, except for slow consumers. These have their
    // frames discarded, and the write in progress cancelled.
    void close(close_reason why)
    {
        if (state_ == connection_state::closed)
            return;
        state_ = connection_state::closed;
        close_reason_ = why;
        if (why == close_reason::slow_consumer)
        {
            queue_.clear();
            write_cancel_.emit(boost::asio::cancellation_type::terminal);
        }
        notify_writer();
    }

    // Transport writes should be bound to this slot, so that a peer
    // that stopped reading can't block the writer forever
    boost::asio::cancellation_slot write_cancellation_slot() noexcept { return write_cancel_.slot(); }

    // Queues a frame to be sent. Frames sent to closed connections are dropped.
    // The caller is responsible for closing the connection on slow_consumer.
    enqueue_result send(outbound_frame frame)
    {
        if (state_ == connection_state::closed)
            return enqueue_result::dropped;
        auto res = queue_.push(std::move(frame));
        if (res == enqueue_result::accepted)
            notify_writer();
        return res;
    }

    // Retrieves the next frame to write, if any
    std::optional<outbound_frame> next_frame() { return queue_.pop(); }

    // Records a malformed frame, returning the total number received so far
    std::size_t record_malformed() noexcept { return ++malformed_count_; }

    // Presence bookkeeping. mark_present returns false if the connection
    // already knew identity was online, mark_absent if it didn't
    bool mark_present(const user_identity& identity) { return known_present_.insert(identity).second; }
    bool mark_absent(const user_identity& identity) { return known_present_.erase(identity) != 0u; }
    const std::set<user_identity>& known_present() const noexcept { return known_present_; }

    // Suspends until send() or close() are called. May complete immediately
    // if one of them was called since the last wait
    boost::asio::awaitable<error_code> wait_ready();
};

}  // namespace lobbychat

#endif
