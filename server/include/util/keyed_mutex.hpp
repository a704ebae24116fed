//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LOBBYCHAT_SERVER_INCLUDE_UTIL_KEYED_MUTEX_HPP
#define LOBBYCHAT_SERVER_INCLUDE_UTIL_KEYED_MUTEX_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/experimental/channel.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

#include "error.hpp"

namespace lobbychat {

// A family of coroutine mutexes, one per key. Used to serialize the
// persist-then-deliver sequence of each conversation, while letting
// unrelated conversations proceed concurrently.
// Entries are created on demand and destroyed when nobody holds or waits for them.
// Not thread-safe: all operations must run within the same strand.
class keyed_mutex
{
    struct entry
    {
        // Is the key locked?
        bool locked{false};

        // Number of coroutines suspended in lock() for this key
        std::size_t waiters{0};

        // Acts as a condition variable, so that coroutines waiting to acquire
        // the key can be notified when another coroutine releases it
        boost::asio::experimental::channel<void(error_code)> chan;

        explicit entry(boost::asio::any_io_executor ex) : chan(std::move(ex)) {}
    };

    boost::asio::any_io_executor ex_;
    std::unordered_map<std::string, std::unique_ptr<entry>> entries_;

    struct guard_deleter
    {
        std::string key;

        void operator()(keyed_mutex* self) const noexcept { self->unlock(key); }
    };

public:
    explicit keyed_mutex(boost::asio::any_io_executor ex) : ex_(std::move(ex)) {}
    keyed_mutex(const keyed_mutex&) = delete;
    keyed_mutex(keyed_mutex&&) = default;
    keyed_mutex& operator=(const keyed_mutex&) = delete;
    keyed_mutex& operator=(keyed_mutex&&) = default;
    ~keyed_mutex() = default;

    // Is key currently locked?
    bool locked(std::string_view key) const;

    // Number of keys with a live entry (locked or with waiters)
    std::size_t size() const noexcept { return entries_.size(); }

    // Unlocks key. key must be locked
    void unlock(const std::string& key) noexcept;

    // Suspends the current coroutine until key can be acquired, then acquires it.
    // The returned guard releases the key on destruction.
    using guard = std::unique_ptr<keyed_mutex, guard_deleter>;
    boost::asio::awaitable<guard> lock(std::string key);
};

}  // namespace lobbychat

#endif
