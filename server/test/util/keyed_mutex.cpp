//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "util/keyed_mutex.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/test/unit_test.hpp>

#include <chrono>
#include <string>
#include <vector>

#include "test_utils.hpp"

using namespace lobbychat;
using namespace lobbychat::test;
namespace asio = boost::asio;

BOOST_AUTO_TEST_SUITE(keyed_mutex_)

BOOST_AUTO_TEST_CASE(lock_unlock)
{
    run_coroutine([]() -> asio::awaitable<void> {
        keyed_mutex mtx(co_await asio::this_coro::executor);

        // Lock
        auto guard = co_await mtx.lock("room:lobby");
        BOOST_TEST(mtx.locked("room:lobby"));
        BOOST_TEST(!mtx.locked("room:arena"));
        BOOST_TEST(mtx.size() == 1u);

        // Unlock. Entries without waiters are released
        guard.reset();
        BOOST_TEST(!mtx.locked("room:lobby"));
        BOOST_TEST(mtx.size() == 0u);
    });
}

BOOST_AUTO_TEST_CASE(keys_independent)
{
    run_coroutine([]() -> asio::awaitable<void> {
        keyed_mutex mtx(co_await asio::this_coro::executor);

        // Holding one key doesn't prevent acquiring another
        auto guard1 = co_await mtx.lock("room:lobby");
        auto guard2 = co_await mtx.lock("room:arena");
        BOOST_TEST(mtx.locked("room:lobby"));
        BOOST_TEST(mtx.locked("room:arena"));
        BOOST_TEST(mtx.size() == 2u);
    });
}

// Several coroutines contending for the same key
BOOST_AUTO_TEST_CASE(serializes_same_key)
{
    asio::io_context ctx;
    keyed_mutex mtx(ctx.get_executor());
    std::vector<std::string> events;
    bool inside = false;
    bool overlapped = false;

    auto task = [&](std::string name) -> asio::awaitable<void> {
        auto guard = co_await mtx.lock("dm:alice\nbob");
        if (inside)
            overlapped = true;
        inside = true;
        events.push_back(name + " in");

        // Suspend while holding the lock
        asio::steady_timer timer(co_await asio::this_coro::executor, std::chrono::milliseconds(5));
        co_await timer.async_wait(asio::use_awaitable);

        events.push_back(name + " out");
        inside = false;
    };

    for (const char* name : {"a", "b", "c"})
        asio::co_spawn(ctx, task(name), rethrow_on_error);
    ctx.run();

    BOOST_TEST(!overlapped);
    BOOST_TEST(events.size() == 6u);
    BOOST_TEST(mtx.size() == 0u);
}

BOOST_AUTO_TEST_SUITE_END()
