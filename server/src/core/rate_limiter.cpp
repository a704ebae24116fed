//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "core/rate_limiter.hpp"

#include <algorithm>
#include <chrono>

using namespace lobbychat;

void token_bucket::refill(clock_type::time_point now) noexcept
{
    // The clock is monotonic, but callers may pass a stale time point
    if (now <= last_refill_)
        return;
    std::chrono::duration<double> elapsed = now - last_refill_;
    tokens_ = std::min(limits_.capacity, tokens_ + elapsed.count() * limits_.refill_per_second);
    last_refill_ = now;
}

bool token_bucket::try_consume(clock_type::time_point now) noexcept
{
    refill(now);
    if (tokens_ < 1.0)
        return false;
    tokens_ -= 1.0;
    return true;
}
