//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LOBBYCHAT_SERVER_INCLUDE_CORE_RATE_LIMITER_HPP
#define LOBBYCHAT_SERVER_INCLUDE_CORE_RATE_LIMITER_HPP

#include <chrono>
#include <cstddef>

namespace lobbychat {

// Token bucket parameters
struct bucket_limits
{
    // Maximum number of tokens, and initial token count
    double capacity;

    // Tokens added per second
    double refill_per_second;
};

// Per-connection admission and backpressure limits
struct connection_limits
{
    // Budget for chat-class commands (join, leave, channel, dm, ping)
    bucket_limits chat{20.0, 10.0};

    // Budget for moderation commands (block, unblock)
    bucket_limits moderation{5.0, 0.5};

    // Maximum number of frames pending to be written to a connection
    std::size_t outbound_depth{256};

    // Connections sending more malformed frames than this are closed
    std::size_t max_malformed{5};
};

// Classic token bucket with continuous refill
class token_bucket
{
public:
    using clock_type = std::chrono::steady_clock;

    token_bucket(bucket_limits limits, clock_type::time_point now) noexcept
        : limits_(limits), tokens_(limits.capacity), last_refill_(now)
    {
    }

    // Consumes a token if one is available
    bool try_consume(clock_type::time_point now) noexcept;

    // Tokens currently available (after refilling)
    double available(clock_type::time_point now) noexcept
    {
        refill(now);
        return tokens_;
    }

private:
    bucket_limits limits_;
    double tokens_;
    clock_type::time_point last_refill_;

    void refill(clock_type::time_point now) noexcept;
};

// Which budget a command draws from
enum class command_class
{
    chat,
    moderation,
};

// The inbound budgets of a connection. Budgets are independent:
// exhausting one doesn't affect the other.
class rate_limiter
{
    token_bucket chat_;
    token_bucket moderation_;

public:
    explicit rate_limiter(
        const connection_limits& limits,
        token_bucket::clock_type::time_point now = token_bucket::clock_type::now()
    ) noexcept
        : chat_(limits.chat, now), moderation_(limits.moderation, now)
    {
    }

    // Returns true and consumes a token if the command is admitted
    bool try_admit(
        command_class cls,
        token_bucket::clock_type::time_point now = token_bucket::clock_type::now()
    ) noexcept
    {
        return (cls == command_class::chat ? chat_ : moderation_).try_consume(now);
    }
};

}  // namespace lobbychat

#endif
