//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "core/notification_relay.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/test/unit_test.hpp>

#include <memory>
#include <string>

#include "business_types.hpp"
#include "core/connection.hpp"
#include "core/session_registry.hpp"
#include "error.hpp"
#include "test_utils.hpp"

using namespace lobbychat;
using namespace lobbychat::test;

namespace {

struct fixture
{
    boost::asio::io_context ctx;
    session_registry sessions;
    notification_relay relay{sessions};

    std::shared_ptr<connection> add(std::string identity, std::size_t depth = 256)
    {
        connection_limits limits;
        limits.outbound_depth = depth;
        auto res = std::make_shared<connection>(sessions.next_connection_id(), ctx.get_executor(), limits);
        res->set_authenticated(std::move(identity));
        BOOST_TEST_REQUIRE(sessions.register_connection(res) == error_code());
        res->set_active();
        return res;
    }
};

}  // namespace

BOOST_AUTO_TEST_SUITE(notification_relay_)

BOOST_FIXTURE_TEST_CASE(invite_to_every_connection, fixture)
{
    auto bob1 = add("bob");
    auto bob2 = add("bob");
    auto carol = add("carol");

    auto delivered = relay.notify("bob", invite_notification{"alice", "match-1"});

    BOOST_TEST(delivered == 2u);
    for (const auto& conn : {bob1, bob2})
    {
        auto frames = drain(*conn);
        BOOST_TEST_REQUIRE(frames.size() == 1u);
        BOOST_TEST(frames[0].at("type").as_string() == "invite");
        BOOST_TEST(frames[0].at("fromUserId").as_string() == "alice");
        BOOST_TEST(frames[0].at("matchId").as_string() == "match-1");
    }
    BOOST_TEST(drain(*carol).empty());
}

BOOST_FIXTURE_TEST_CASE(tournament_announce, fixture)
{
    auto bob = add("bob");

    auto delivered = relay.notify(
        "bob",
        tournament_announce_notification{"final", "alice", "bob", parse_timestamp(1700000000000)}
    );

    BOOST_TEST(delivered == 1u);
    auto frames = drain(*bob);
    BOOST_TEST_REQUIRE(frames.size() == 1u);
    BOOST_TEST(frames[0].at("type").as_string() == "tournamentAnnounce");
    BOOST_TEST(frames[0].at("matchId").as_string() == "final");
    BOOST_TEST(frames[0].at("p1").as_string() == "alice");
    BOOST_TEST(frames[0].at("p2").as_string() == "bob");
    BOOST_TEST(frames[0].at("eta").as_int64() == 1700000000000);
}

BOOST_FIXTURE_TEST_CASE(offline_user, fixture)
{
    BOOST_TEST(relay.notify("bob", invite_notification{"alice", "match-1"}) == 0u);
}

BOOST_FIXTURE_TEST_CASE(closed_connections_skipped, fixture)
{
    auto bob1 = add("bob");
    auto bob2 = add("bob");
    bob1->close(close_reason::transport_closed);

    BOOST_TEST(relay.notify("bob", invite_notification{"alice", "match-1"}) == 1u);
    BOOST_TEST(drain(*bob2).size() == 1u);
}

BOOST_FIXTURE_TEST_CASE(never_evicted, fixture)
{
    auto bob = add("bob", 2);

    // Fill the queue with notifications. The next one can't be queued,
    // so bob is too slow and gets disconnected
    BOOST_TEST(relay.notify("bob", invite_notification{"alice", "m1"}) == 1u);
    BOOST_TEST(relay.notify("bob", invite_notification{"alice", "m2"}) == 1u);
    BOOST_TEST(relay.notify("bob", invite_notification{"alice", "m3"}) == 0u);

    BOOST_TEST(bob->is_closed());
    BOOST_TEST((bob->reason() == close_reason::slow_consumer));
    BOOST_TEST(!sessions.is_online("bob"));
}

BOOST_FIXTURE_TEST_CASE(evicts_presence, fixture)
{
    auto bob = add("bob", 2);
    bob->send({std::make_shared<const std::string>(R"({"type":"presence","userId":"a","online":true})"),
               frame_class::presence});
    bob->send({std::make_shared<const std::string>(R"({"type":"presence","userId":"c","online":true})"),
               frame_class::presence});

    BOOST_TEST(relay.notify("bob", invite_notification{"alice", "m1"}) == 1u);

    auto frames = drain(*bob);
    BOOST_TEST_REQUIRE(frames.size() == 2u);
    BOOST_TEST(frames[0].at("userId").as_string() == "c");
    BOOST_TEST(frames[1].at("type").as_string() == "invite");
}

BOOST_AUTO_TEST_SUITE_END()
