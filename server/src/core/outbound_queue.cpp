//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "core/outbound_queue.hpp"

#include <algorithm>
#include <utility>

using namespace lobbychat;

enqueue_result outbound_queue::push(outbound_frame frame)
{
    if (frames_.size() < max_depth_)
    {
        frames_.push_back(std::move(frame));
        return enqueue_result::accepted;
    }

    // Full. Chat frames are never dropped nor evict other frames
    if (frame.cls == frame_class::chat)
        return enqueue_result::slow_consumer;

    // Make room by discarding the oldest presence frame
    auto it = std::find_if(frames_.begin(), frames_.end(), [](const outbound_frame& f) {
        return f.cls == frame_class::presence;
    });
    if (it != frames_.end())
    {
        frames_.erase(it);
        frames_.push_back(std::move(frame));
        return enqueue_result::accepted;
    }

    // Nothing we can evict
    return frame.cls == frame_class::presence ? enqueue_result::dropped : enqueue_result::slow_consumer;
}

std::optional<outbound_frame> outbound_queue::pop()
{
    if (frames_.empty())
        return std::nullopt;
    auto res = std::move(frames_.front());
    frames_.pop_front();
    return res;
}
