//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/asio/awaitable.hpp>
#include <boost/test/unit_test.hpp>

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"
#include "services/history_store.hpp"
#include "test_utils.hpp"

using namespace lobbychat;
using namespace lobbychat::test;
namespace asio = boost::asio;

namespace {

message room_message(std::string room, std::string body, std::int64_t ts)
{
    return message{0, "alice", room_destination{std::move(room)}, std::move(body), parse_timestamp(ts)};
}

message dm(std::string from, std::string to, std::string body, std::int64_t ts)
{
    return message{0, std::move(from), dm_destination{std::move(to)}, std::move(body), parse_timestamp(ts)};
}

std::vector<std::string> bodies(const message_batch& batch)
{
    std::vector<std::string> res;
    for (const auto& msg : batch.messages)
        res.push_back(msg.body);
    return res;
}

}  // namespace

BOOST_AUTO_TEST_SUITE(history_cursors)

BOOST_AUTO_TEST_CASE(format)
{
    BOOST_TEST(format_cursor({1700000000123, 42}) == "1700000000123-42");
}

BOOST_AUTO_TEST_CASE(parse_success)
{
    auto res = parse_cursor("1700000000123-42");
    BOOST_TEST_REQUIRE(res.has_value());
    BOOST_TEST(res->created_at == 1700000000123);
    BOOST_TEST(res->id == 42);
}

BOOST_AUTO_TEST_CASE(parse_error)
{
    for (std::string_view input :
         {"", "-", "123", "123-", "-42", "abc-42", "123-abc", "123-42-1", "123--42", "123-42 ", "1.5-2"})
    {
        BOOST_TEST_CONTEXT(input)
        {
            BOOST_TEST(parse_cursor(input).error() == error_code(errc::invalid_cursor));
        }
    }
}

BOOST_AUTO_TEST_CASE(limit_clamping)
{
    BOOST_TEST(clamp_history_limit(std::nullopt) == 50u);
    BOOST_TEST(clamp_history_limit(0) == 1u);
    BOOST_TEST(clamp_history_limit(-10) == 1u);
    BOOST_TEST(clamp_history_limit(1) == 1u);
    BOOST_TEST(clamp_history_limit(30) == 30u);
    BOOST_TEST(clamp_history_limit(100) == 100u);
    BOOST_TEST(clamp_history_limit(1000) == 100u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(memory_history_store)

BOOST_AUTO_TEST_CASE(append_assigns_increasing_ids)
{
    run_coroutine([]() -> asio::awaitable<void> {
        auto store = create_memory_history_store();
        auto id1 = co_await store->append(room_message("lobby", "a", 1000));
        auto id2 = co_await store->append(room_message("arena", "b", 1000));
        BOOST_TEST_REQUIRE(id1.has_value());
        BOOST_TEST_REQUIRE(id2.has_value());
        BOOST_TEST(*id2 > *id1);
    });
}

BOOST_AUTO_TEST_CASE(room_newest_first)
{
    run_coroutine([]() -> asio::awaitable<void> {
        auto store = create_memory_history_store();
        co_await store->append(room_message("lobby", "first", 1000));
        co_await store->append(room_message("arena", "other room", 1500));
        co_await store->append(room_message("lobby", "second", 2000));
        co_await store->append(room_message("lobby", "same ts", 2000));

        auto res = co_await store->query_room("lobby", 10, std::nullopt);
        BOOST_TEST_REQUIRE(res.has_value());
        std::vector<std::string> expected{"same ts", "second", "first"};
        BOOST_TEST(bodies(*res) == expected);
        BOOST_TEST(!res->has_more);

        // Messages carry their destination and timestamps
        BOOST_TEST(*res->messages[2].room() == "lobby");
        BOOST_TEST(serialize_timestamp(res->messages[2].created_at) == 1000);
    });
}

BOOST_AUTO_TEST_CASE(room_limit_and_has_more)
{
    run_coroutine([]() -> asio::awaitable<void> {
        auto store = create_memory_history_store();
        for (int i = 0; i < 5; ++i)
            co_await store->append(room_message("lobby", std::to_string(i), 1000 + i));

        auto res = co_await store->query_room("lobby", 3, std::nullopt);
        BOOST_TEST_REQUIRE(res.has_value());
        std::vector<std::string> expected{"4", "3", "2"};
        BOOST_TEST(bodies(*res) == expected);
        BOOST_TEST(res->has_more);

        // Exactly limit messages remaining
        res = co_await store->query_room("lobby", 5, std::nullopt);
        BOOST_TEST_REQUIRE(res.has_value());
        BOOST_TEST(res->messages.size() == 5u);
        BOOST_TEST(!res->has_more);
    });
}

BOOST_AUTO_TEST_CASE(pagination_exhaustive_under_appends)
{
    run_coroutine([]() -> asio::awaitable<void> {
        auto store = create_memory_history_store();
        for (int i = 0; i < 10; ++i)
            co_await store->append(room_message("lobby", std::to_string(i), 1000 + i / 3));

        // Page through the history while new messages are being appended
        std::vector<std::string> seen;
        std::optional<history_cursor> cursor;
        for (int page = 0; page < 10; ++page)
        {
            auto res = co_await store->query_room("lobby", 3, cursor);
            BOOST_TEST_REQUIRE(res.has_value());
            for (const auto& msg : res->messages)
                seen.push_back(msg.body);
            co_await store->append(room_message("lobby", "new " + std::to_string(page), 5000 + page));
            if (!res->has_more)
                break;
            cursor = cursor_for(res->messages.back());
        }

        // Every message existing when we started was seen exactly once, newest first
        std::vector<std::string> expected{"9", "8", "7", "6", "5", "4", "3", "2", "1", "0"};
        BOOST_TEST(seen == expected);
    });
}

BOOST_AUTO_TEST_CASE(dm_both_directions)
{
    run_coroutine([]() -> asio::awaitable<void> {
        auto store = create_memory_history_store();
        co_await store->append(dm("alice", "bob", "hi bob", 1000));
        co_await store->append(dm("bob", "alice", "hi alice", 2000));
        co_await store->append(dm("alice", "carol", "hi carol", 3000));
        co_await store->append(room_message("alice", "room named alice", 4000));

        auto res = co_await store->query_dm("bob", "alice", 10, std::nullopt);
        BOOST_TEST_REQUIRE(res.has_value());
        std::vector<std::string> expected{"hi alice", "hi bob"};
        BOOST_TEST(bodies(*res) == expected);
        BOOST_TEST(*res->messages[1].recipient_id() == "bob");
        BOOST_TEST(res->messages[1].sender_id == "alice");
    });
}

BOOST_AUTO_TEST_CASE(list_conversations)
{
    run_coroutine([]() -> asio::awaitable<void> {
        auto store = create_memory_history_store();
        co_await store->append(dm("alice", "bob", "1", 1000));
        co_await store->append(dm("carol", "alice", "2", 2000));
        co_await store->append(room_message("lobby", "3", 3000));
        co_await store->append(dm("bob", "alice", "4", 4000));
        co_await store->append(dm("bob", "carol", "5", 5000));

        // Both directions count. Each peer appears once, with its latest message
        auto convs = co_await store->list_conversations("alice", 10);
        BOOST_TEST_REQUIRE(convs.has_value());
        BOOST_TEST_REQUIRE(convs->size() == 2u);
        BOOST_TEST((*convs)[0].peer == "bob");
        BOOST_TEST(serialize_timestamp((*convs)[0].last_message_at) == 4000);
        BOOST_TEST((*convs)[1].peer == "carol");
        BOOST_TEST(serialize_timestamp((*convs)[1].last_message_at) == 2000);

        // Limit
        convs = co_await store->list_conversations("alice", 1);
        BOOST_TEST_REQUIRE(convs.has_value());
        BOOST_TEST_REQUIRE(convs->size() == 1u);
        BOOST_TEST((*convs)[0].peer == "bob");

        // No DMs
        convs = co_await store->list_conversations("dave", 10);
        BOOST_TEST(convs.value().empty());
    });
}

BOOST_AUTO_TEST_SUITE_END()
