//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "core/session_registry.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/core/span.hpp>
#include <boost/test/unit_test.hpp>

#include <memory>
#include <string>
#include <vector>

#include "core/connection.hpp"
#include "error.hpp"

using namespace lobbychat;

namespace {

// Records presence edges
struct recording_listener final : presence_listener
{
    std::vector<std::string> online;
    std::vector<std::string> offline;
    std::vector<std::vector<std::string>> offline_rooms;

    void on_online(const user_identity& identity) override { online.push_back(identity); }
    void on_offline(const user_identity& identity, boost::span<const std::string> rooms) override
    {
        offline.push_back(identity);
        offline_rooms.emplace_back(rooms.begin(), rooms.end());
    }
};

struct fixture
{
    boost::asio::io_context ctx;
    session_registry reg;
    recording_listener listener;

    fixture() { reg.set_presence_listener(&listener); }

    std::shared_ptr<connection> make_connection(std::string identity)
    {
        auto res = std::make_shared<connection>(reg.next_connection_id(), ctx.get_executor(), connection_limits());
        res->set_authenticated(std::move(identity));
        return res;
    }

    std::shared_ptr<connection> add(std::string identity)
    {
        auto res = make_connection(std::move(identity));
        BOOST_TEST_REQUIRE(reg.register_connection(res) == error_code());
        return res;
    }
};

}  // namespace

BOOST_AUTO_TEST_SUITE(session_registry_)

BOOST_FIXTURE_TEST_CASE(register_and_find, fixture)
{
    auto conn = add("alice");

    BOOST_TEST(reg.size() == 1u);
    BOOST_TEST(reg.find(conn->id()).get() == conn.get());
    BOOST_TEST(reg.is_online("alice"));
    BOOST_TEST(!reg.is_online("bob"));
    BOOST_TEST(reg.connections_for("alice").size() == 1u);
    BOOST_TEST(!reg.find(conn->id() + 100u));
}

BOOST_FIXTURE_TEST_CASE(register_duplicate_id, fixture)
{
    auto conn = add("alice");
    BOOST_TEST(reg.register_connection(conn) == error_code(errc::duplicate_connection));
    BOOST_TEST(reg.size() == 1u);
}

BOOST_FIXTURE_TEST_CASE(register_unauthenticated, fixture)
{
    auto conn = std::make_shared<connection>(reg.next_connection_id(), ctx.get_executor(), connection_limits());
    BOOST_TEST(reg.register_connection(conn) == error_code(errc::unauthorized));
    BOOST_TEST(reg.size() == 0u);
}

BOOST_FIXTURE_TEST_CASE(unregister_idempotent, fixture)
{
    auto conn = add("alice");
    reg.unregister_connection(conn->id());
    reg.unregister_connection(conn->id());

    BOOST_TEST(reg.size() == 0u);
    BOOST_TEST(!reg.is_online("alice"));
    BOOST_TEST(listener.offline.size() == 1u);
}

BOOST_FIXTURE_TEST_CASE(presence_edges_once_per_identity, fixture)
{
    // Two connections for the same identity produce a single online edge
    auto conn1 = add("alice");
    auto conn2 = add("alice");
    BOOST_TEST(listener.online == std::vector<std::string>{"alice"});

    // Closing one of them doesn't make alice offline
    reg.unregister_connection(conn1->id());
    BOOST_TEST(listener.offline.empty());
    BOOST_TEST(reg.is_online("alice"));

    // Closing the last one does
    reg.unregister_connection(conn2->id());
    BOOST_TEST(listener.offline == std::vector<std::string>{"alice"});

    // A new online period triggers a new edge
    add("alice");
    BOOST_TEST(listener.online.size() == 2u);
}

BOOST_FIXTURE_TEST_CASE(subscribe_reports_first_presence, fixture)
{
    auto conn1 = add("alice");
    auto conn2 = add("alice");

    auto res = reg.subscribe(conn1->id(), "lobby");
    BOOST_TEST_REQUIRE(res.has_value());
    BOOST_TEST(*res);

    // Idempotent
    res = reg.subscribe(conn1->id(), "lobby");
    BOOST_TEST_REQUIRE(res.has_value());
    BOOST_TEST(!*res);
    BOOST_TEST(reg.subscribers_of("lobby").size() == 1u);

    // The identity is already present, even if this is another connection
    res = reg.subscribe(conn2->id(), "lobby");
    BOOST_TEST_REQUIRE(res.has_value());
    BOOST_TEST(!*res);
    BOOST_TEST(reg.subscribers_of("lobby").size() == 2u);
    BOOST_TEST(reg.members_of("lobby") == std::vector<std::string>{"alice"});
}

BOOST_FIXTURE_TEST_CASE(subscribe_unknown_connection, fixture)
{
    auto conn = make_connection("alice");
    auto res = reg.subscribe(conn->id(), "lobby");
    BOOST_TEST(res.error() == error_code(errc::not_found));
    BOOST_TEST(reg.subscribers_of("lobby").empty());
}

BOOST_FIXTURE_TEST_CASE(unsubscribe, fixture)
{
    auto conn = add("alice");
    reg.subscribe(conn->id(), "lobby").value();
    reg.subscribe(conn->id(), "arena").value();

    // The identity is no longer in the room
    BOOST_TEST(reg.unsubscribe(conn->id(), "lobby"));

    // Removing it twice is a no-op
    BOOST_TEST(!reg.unsubscribe(conn->id(), "lobby"));

    BOOST_TEST(!reg.is_subscribed(conn->id(), "lobby"));
    BOOST_TEST(reg.is_subscribed(conn->id(), "arena"));

    // Joining again is a new presence in the room
    BOOST_TEST(reg.subscribe(conn->id(), "lobby").value());
}

BOOST_FIXTURE_TEST_CASE(unsubscribe_other_connection_remains, fixture)
{
    auto conn1 = add("alice");
    auto conn2 = add("alice");
    reg.subscribe(conn1->id(), "lobby").value();
    reg.subscribe(conn2->id(), "lobby").value();

    // alice is still present through conn2
    BOOST_TEST(!reg.unsubscribe(conn1->id(), "lobby"));
    BOOST_TEST(reg.members_of("lobby") == std::vector<std::string>{"alice"});

    BOOST_TEST(reg.unsubscribe(conn2->id(), "lobby"));
    BOOST_TEST(reg.members_of("lobby").empty());

    // Left rooms aren't reported on the offline edge
    reg.unregister_connection(conn1->id());
    reg.unregister_connection(conn2->id());
    BOOST_TEST_REQUIRE(listener.offline_rooms.size() == 1u);
    BOOST_TEST(listener.offline_rooms[0].empty());
}

BOOST_FIXTURE_TEST_CASE(shares_presence, fixture)
{
    auto alice = add("alice");
    auto bob = add("bob");
    reg.subscribe(alice->id(), "lobby").value();
    reg.subscribe(alice->id(), "arena").value();
    reg.subscribe(bob->id(), "lobby").value();

    BOOST_TEST(reg.shares_presence(*bob, "alice"));
    BOOST_TEST(!reg.shares_presence(*bob, "carol"));

    // A room bob isn't in doesn't count
    reg.unsubscribe(alice->id(), "lobby");
    BOOST_TEST(!reg.shares_presence(*bob, "alice"));
    BOOST_TEST(!reg.shares_presence(*alice, "bob"));
}

BOOST_FIXTURE_TEST_CASE(members_sorted_and_unique, fixture)
{
    auto carol = add("carol");
    auto alice1 = add("alice");
    auto alice2 = add("alice");
    auto bob = add("bob");
    for (const auto& conn : {carol, alice1, alice2, bob})
        reg.subscribe(conn->id(), "lobby").value();

    std::vector<std::string> expected{"alice", "bob", "carol"};
    BOOST_TEST(reg.members_of("lobby") == expected);
    BOOST_TEST(reg.subscribers_of("lobby").size() == 4u);
    BOOST_TEST(reg.members_of("arena").empty());
}

BOOST_FIXTURE_TEST_CASE(offline_reports_announced_rooms, fixture)
{
    auto conn = add("alice");
    reg.subscribe(conn->id(), "lobby").value();
    reg.subscribe(conn->id(), "arena").value();

    reg.unregister_connection(conn->id());

    BOOST_TEST_REQUIRE(listener.offline_rooms.size() == 1u);
    std::vector<std::string> expected{"arena", "lobby"};
    BOOST_TEST(listener.offline_rooms[0] == expected);
    BOOST_TEST(reg.subscribers_of("lobby").empty());

    // A new online period starts with no announced rooms
    auto conn2 = add("alice");
    BOOST_TEST(reg.subscribe(conn2->id(), "lobby").value());
}

BOOST_FIXTURE_TEST_CASE(close_marks_and_unregisters, fixture)
{
    auto conn = add("alice");
    reg.close(*conn, close_reason::protocol_abuse);

    BOOST_TEST(conn->is_closed());
    BOOST_TEST((conn->reason() == close_reason::protocol_abuse));
    BOOST_TEST(reg.size() == 0u);
}

BOOST_AUTO_TEST_SUITE_END()
