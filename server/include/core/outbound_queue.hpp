//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LOBBYCHAT_SERVER_INCLUDE_CORE_OUTBOUND_QUEUE_HPP
#define LOBBYCHAT_SERVER_INCLUDE_CORE_OUTBOUND_QUEUE_HPP

#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <string>

namespace lobbychat {

// Determines what happens to a frame when the queue it's pushed to is full
enum class frame_class
{
    chat,      // messages. Never dropped: overflowing means the consumer is too slow
    presence,  // online/offline notices. Droppable and evictable
    system,    // acks, errors, notifications. Never dropped, may evict presence frames
};

// A serialized frame, ready to be written to a websocket.
// The payload is shared between all the recipients of a fan-out.
struct outbound_frame
{
    std::shared_ptr<const std::string> payload;
    frame_class cls;
};

enum class enqueue_result
{
    accepted,      // the frame was queued (possibly evicting an older presence frame)
    dropped,       // the frame was discarded, but the connection is healthy
    slow_consumer  // the frame couldn't be queued and the connection must be closed
};

// A bounded FIFO of frames pending to be written to a single connection
class outbound_queue
{
    std::deque<outbound_frame> frames_;
    std::size_t max_depth_;

public:
    // max_depth must be at least 1
    explicit outbound_queue(std::size_t max_depth) noexcept : max_depth_(max_depth) {}

    std::size_t size() const noexcept { return frames_.size(); }
    bool empty() const noexcept { return frames_.empty(); }
    std::size_t max_depth() const noexcept { return max_depth_; }

    // Adds a frame at the back of the queue, applying the overflow policy if full
    enqueue_result push(outbound_frame frame);

    // Removes the frame at the front of the queue, if any
    std::optional<outbound_frame> pop();

    // Discards all pending frames
    void clear() noexcept { frames_.clear(); }
};

}  // namespace lobbychat

#endif
