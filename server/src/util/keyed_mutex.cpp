//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "util/keyed_mutex.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/system/system_error.hpp>

#include <cassert>
#include <string>

using namespace lobbychat;
namespace asio = boost::asio;

bool keyed_mutex::locked(std::string_view key) const
{
    auto it = entries_.find(std::string(key));
    return it != entries_.end() && it->second->locked;
}

void keyed_mutex::unlock(const std::string& key) noexcept
{
    auto it = entries_.find(key);
    assert(it != entries_.end() && it->second->locked);
    auto& ent = *it->second;
    ent.locked = false;

    // Wake up one of the waiters. It's responsible for the entry from now on.
    // If nobody is waiting, the entry is no longer needed
    if (ent.waiters > 0u)
        ent.chan.try_send(error_code());
    else
        entries_.erase(it);
}

asio::awaitable<keyed_mutex::guard> keyed_mutex::lock(std::string key)
{
    auto it = entries_.find(key);
    if (it == entries_.end())
        it = entries_.emplace(key, std::make_unique<entry>(ex_)).first;

    // The entry can't be destroyed while we're waiting, since waiters > 0.
    // Entries are heap-allocated, so rehashing doesn't invalidate ent
    entry& ent = *it->second;

    // Another coroutine may acquire the key between our wake-up and our resumption.
    // This loop guards against it
    while (ent.locked)
    {
        ++ent.waiters;
        auto [ec] = co_await ent.chan.async_receive(asio::as_tuple);
        --ent.waiters;
        if (ec)
            throw boost::system::system_error(ec);
    }

    ent.locked = true;
    co_return guard(this, guard_deleter{std::move(key)});
}
